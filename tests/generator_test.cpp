#include <gtest/gtest.h>

#include <map>

#include "errors.h"
#include "generator.h"
#include "test_helpers.h"
#include "validator.h"

static std::vector<ScheduleGrid> generate(const GenerationInput& input) {
    RequirementSet set = computeRequirements(input.schoolClass, input.subjects, input.assignments);
    return generateClassSchedule(input, set);
}

TEST(GeneratorTest, SixSubjectsOfFiveHoursFillTheWeek) {
    GenerationInput input = sixSubjectInput(1, 1);

    std::vector<ScheduleGrid> grids = generate(input);

    ASSERT_EQ(grids.size(), 1u);
    EXPECT_EQ(grids[0].section, "1");
    EXPECT_EQ(grids[0].cells.size(), static_cast<size_t>(kSlotsPerWeek));
    EXPECT_TRUE(grids[0].warnings.empty());

    std::map<int, int> perSubject;
    for (const ScheduleCell& c : grids[0].cells) {
        perSubject[c.subjectId]++;
        EXPECT_EQ(c.classId, 1);
        EXPECT_EQ(c.teacherId, c.subjectId - 100);
    }
    ASSERT_EQ(perSubject.size(), 6u);
    for (const auto& p : perSubject) {
        EXPECT_EQ(p.second, 5);
    }
}

TEST(GeneratorTest, SubjectIsSpreadOneLessonPerDay) {
    GenerationInput input = sixSubjectInput(1, 1);

    std::vector<ScheduleGrid> grids = generate(input);

    std::map<int, int> daysOfFirstSubject;
    for (const ScheduleCell& c : grids[0].cells) {
        if (c.subjectId == 101) {
            daysOfFirstSubject[c.day]++;
            EXPECT_EQ(c.period, 0);
        }
    }
    EXPECT_EQ(daysOfFirstSubject.size(), static_cast<size_t>(kDaysPerWeek));
}

TEST(GeneratorTest, SectionsSharingTeachersDoNotCollide) {
    GenerationInput input = sixSubjectInput(1, 2);
    RequirementSet set = computeRequirements(input.schoolClass, input.subjects, input.assignments);

    std::vector<ScheduleGrid> grids = generateClassSchedule(input, set);

    ASSERT_EQ(grids.size(), 2u);
    GridIntegrityValidator validator;
    IntegrityResult result = validator.checkAll(input, set, grids);
    EXPECT_TRUE(result.ok);
}

TEST(GeneratorTest, SourceAvailabilityIsNotModified) {
    GenerationInput input = sixSubjectInput(1, 1);

    generate(input);

    for (const TeacherAvailability& t : input.teachers) {
        EXPECT_EQ(t.grid, AvailabilityGrid::allFree());
    }
}

TEST(GeneratorTest, RequiredSlotIsPinnedFirst) {
    GenerationInput input = sixSubjectInput(1, 1);

    Constraint c;
    c.id        = 1;
    c.type      = ConstraintType::Required;
    c.subjectId = 106;
    c.day       = 2;
    c.period    = 0;
    input.constraints.push_back(c);

    std::vector<ScheduleGrid> grids = generate(input);

    bool pinned = false;
    for (const ScheduleCell& cell : grids[0].cells) {
        if (cell.day == 2 && cell.period == 0) {
            EXPECT_EQ(cell.subjectId, 106);
            pinned = true;
        }
    }
    EXPECT_TRUE(pinned);
    EXPECT_EQ(grids[0].cells.size(), static_cast<size_t>(kSlotsPerWeek));
}

TEST(GeneratorTest, ForbiddenSlotIsAvoided) {
    GenerationInput input = sixSubjectInput(1, 1);

    Constraint c;
    c.id        = 2;
    c.type      = ConstraintType::Forbidden;
    c.subjectId = 101;
    c.day       = 0;
    c.period    = 0;
    input.constraints.push_back(c);

    std::vector<ScheduleGrid> grids = generate(input);

    for (const ScheduleCell& cell : grids[0].cells) {
        if (cell.day == 0 && cell.period == 0) {
            EXPECT_NE(cell.subjectId, 101);
        }
    }
}

TEST(GeneratorTest, SoftRuleIsRelaxedWithWarning) {
    GenerationInput input = sixSubjectInput(1, 1);

    Constraint c;
    c.id       = 3;
    c.type     = ConstraintType::MaxConsecutive;
    c.limit    = 1;
    c.priority = 2;
    input.constraints.push_back(c);

    std::vector<ScheduleGrid> grids = generate(input);

    EXPECT_EQ(grids[0].cells.size(), static_cast<size_t>(kSlotsPerWeek));
    EXPECT_FALSE(grids[0].warnings.empty());
}

TEST(GeneratorTest, HardRuleThatCannotBeMetAborts) {
    GenerationInput input = sixSubjectInput(1, 1);

    Constraint c;
    c.id       = 4;
    c.type     = ConstraintType::MaxConsecutive;
    c.limit    = 1;
    c.priority = 4;
    input.constraints.push_back(c);

    EXPECT_THROW(generate(input), GenerationError);
}

TEST(GeneratorTest, FailureNamesSubjectAndMissingHours) {
    GenerationInput input = sixSubjectInput(1, 1);
    input.teachers[0] = partlyFreeTeacher(1, "T1", 4);

    try {
        generate(input);
        FAIL() << "GenerationError expected";
    } catch (const GenerationError& ex) {
        EXPECT_EQ(ex.code(), "generation_error");
        EXPECT_EQ(ex.failure().subjectId, 101);
        EXPECT_EQ(ex.failure().teacherId, 1);
        EXPECT_EQ(ex.failure().section, "1");
        EXPECT_EQ(ex.failure().occurrence, 5);
        EXPECT_EQ(ex.failure().missingHours, 1);
    }
}
