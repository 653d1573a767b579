#include <gtest/gtest.h>

#include "conflicts.h"
#include "memory_store.h"
#include "service.h"
#include "test_helpers.h"

// Полная сетка секции: предмет 101..106 по урокам, учитель = предмет - 100
static std::vector<PublishedCell> fullSection(int classId, const std::string& section, int teacherBase = 0) {
    std::vector<PublishedCell> cells;
    for (int day = 0; day < kDaysPerWeek; ++day) {
        for (int period = 0; period < kPeriodsPerDay; ++period) {
            ScheduleCell c{classId, section, day, period, classId * 100 + period + 1, teacherBase + period + 1};
            cells.push_back(PublishedCell{kYear, SessionType::Morning, c, ""});
        }
    }
    return cells;
}

static std::vector<TeacherAvailability> assignedTeachers(const std::vector<PublishedCell>& cells) {
    std::vector<TeacherAvailability> teachers;
    for (int id = 1; id <= 20; ++id) teachers.push_back(freeTeacher(id, "T" + std::to_string(id)));
    for (const PublishedCell& pc : cells) {
        for (TeacherAvailability& t : teachers) {
            if (t.teacherId == pc.cell.teacherId && t.grid.isFree(pc.cell.day, pc.cell.period)) {
                t.grid.markAssigned(pc.cell.day, pc.cell.period);
            }
        }
    }
    return teachers;
}

static int countKind(const std::vector<ConflictDetail>& conflicts, ConflictKind kind) {
    int n = 0;
    for (const ConflictDetail& d : conflicts) {
        if (d.kind == kind) ++n;
    }
    return n;
}

TEST(ConflictsTest, CleanGridHasNoConflicts) {
    std::vector<PublishedCell> cells = fullSection(1, "1");
    std::vector<ConflictDetail> conflicts =
        findConflicts(1, kYear, SessionType::Morning, cells, {}, assignedTeachers(cells));
    EXPECT_TRUE(conflicts.empty());
}

TEST(ConflictsTest, TeacherSharedWithAnotherClassIsDoubleBooked) {
    std::vector<PublishedCell> cells = fullSection(1, "1");
    PublishedCell foreign{kYear, SessionType::Morning, ScheduleCell{2, "1", 0, 0, 201, 1}, ""};
    cells.push_back(foreign);

    std::vector<ConflictDetail> conflicts =
        findConflicts(1, kYear, SessionType::Morning, cells, {}, assignedTeachers(cells));

    ASSERT_EQ(countKind(conflicts, ConflictKind::TeacherDoubleBooked), 1);
    for (const ConflictDetail& d : conflicts) {
        if (d.kind != ConflictKind::TeacherDoubleBooked) continue;
        EXPECT_EQ(d.teacherId, 1);
        EXPECT_EQ(d.otherClassId.value_or(0), 2);
        EXPECT_EQ(d.day, 0);
        EXPECT_EQ(d.period, 0);
    }
}

TEST(ConflictsTest, OtherYearDoesNotCount) {
    std::vector<PublishedCell> cells = fullSection(1, "1");
    PublishedCell otherYear{kYear + 1, SessionType::Morning, ScheduleCell{2, "1", 0, 0, 201, 1}, ""};
    cells.push_back(otherYear);

    std::vector<ConflictDetail> conflicts =
        findConflicts(1, kYear, SessionType::Morning, cells, {}, assignedTeachers(fullSection(1, "1")));
    EXPECT_EQ(countKind(conflicts, ConflictKind::TeacherDoubleBooked), 0);
}

TEST(ConflictsTest, HoleInGridIsReported) {
    std::vector<PublishedCell> cells = fullSection(1, "1");
    cells.erase(cells.begin() + 7); // понедельник, урок 2

    std::vector<ConflictDetail> conflicts =
        findConflicts(1, kYear, SessionType::Morning, cells, {}, assignedTeachers(cells));

    ASSERT_EQ(countKind(conflicts, ConflictKind::EmptySlot), 1);
    EXPECT_EQ(conflicts[0].day, 1);
    EXPECT_EQ(conflicts[0].period, 1);
}

TEST(ConflictsTest, ForbiddenAndRequiredViolations) {
    std::vector<PublishedCell> cells = fullSection(1, "1");

    Constraint forbidden;
    forbidden.id        = 10;
    forbidden.type      = ConstraintType::Forbidden;
    forbidden.teacherId = 1;
    forbidden.day       = 2;
    forbidden.period    = 0;

    Constraint required;
    required.id        = 11;
    required.type      = ConstraintType::Required;
    required.subjectId = 106;
    required.day       = 0;
    required.period    = 0;

    std::vector<ConflictDetail> conflicts = findConflicts(
        1, kYear, SessionType::Morning, cells, {forbidden, required}, assignedTeachers(cells));

    EXPECT_EQ(countKind(conflicts, ConflictKind::ForbiddenViolated), 1);
    EXPECT_EQ(countKind(conflicts, ConflictKind::RequiredMissing), 1);
}

TEST(ConflictsTest, ConsecutiveAndBreakRulesArePerDay) {
    std::vector<PublishedCell> cells = fullSection(1, "1");
    // вторник: предмет 101 на уроках 1 и 2 подряд
    for (PublishedCell& pc : cells) {
        if (pc.cell.day == 2 && pc.cell.period == 1) {
            pc.cell.subjectId = 101;
            pc.cell.teacherId = 1;
        }
    }

    Constraint maxRun;
    maxRun.id        = 20;
    maxRun.type      = ConstraintType::MaxConsecutive;
    maxRun.subjectId = 101;
    maxRun.limit     = 1;

    Constraint minBreak;
    minBreak.id        = 21;
    minBreak.type      = ConstraintType::MinBreak;
    minBreak.subjectId = 101;
    minBreak.limit     = 2;

    std::vector<ConflictDetail> conflicts = findConflicts(
        1, kYear, SessionType::Morning, cells, {maxRun, minBreak}, assignedTeachers(cells));

    ASSERT_EQ(countKind(conflicts, ConflictKind::MaxConsecutiveExceeded), 1);
    ASSERT_EQ(countKind(conflicts, ConflictKind::MinBreakViolated), 1);
    for (const ConflictDetail& d : conflicts) {
        if (d.kind == ConflictKind::MaxConsecutiveExceeded) {
            EXPECT_EQ(d.day, 2);
            EXPECT_EQ(d.period, -1);
        }
    }
}

TEST(ConflictsTest, AvailabilityNotMarkedAssignedIsMismatch) {
    std::vector<PublishedCell> cells = fullSection(1, "1");
    std::vector<TeacherAvailability> teachers = assignedTeachers(cells);
    teachers[0].grid = AvailabilityGrid::allFree(); // учитель 1

    std::vector<ConflictDetail> conflicts =
        findConflicts(1, kYear, SessionType::Morning, cells, {}, teachers);

    EXPECT_EQ(countKind(conflicts, ConflictKind::AvailabilityMismatch), kDaysPerWeek);
}

TEST(ConflictsTest, ServiceResolvesAcrossPublishedScopes) {
    MemoryScheduleStore store;
    TimetableService service{store};
    seedSixSubjectClass(store, 1, 1);

    EXPECT_TRUE(service.resolveConflicts(1).empty());

    service.publish(service.generatePreview(ScheduleRequest{kYear, SessionType::Morning, 1, ""}).token);
    EXPECT_TRUE(service.resolveConflicts(1).empty());
    EXPECT_TRUE(service.resolveConflicts(1, kYear, SessionType::Evening).empty());

    store.setTeacherAvailability(2, AvailabilityGrid::allFree());
    std::vector<ConflictDetail> conflicts = service.resolveConflicts(1, kYear);
    EXPECT_EQ(countKind(conflicts, ConflictKind::AvailabilityMismatch), kDaysPerWeek);
}
