#include "conflicts.h"

#include "constraints.h"
#include "logger.h"
#include "requirements.h"

#include <map>

namespace {

ConflictDetail makeDetail(
    ConflictKind kind,
    int academicYearId,
    SessionType sessionType,
    int classId,
    const std::string& section,
    int day,
    int period
) {
    ConflictDetail d;
    d.kind           = kind;
    d.academicYearId = academicYearId;
    d.sessionType    = sessionType;
    d.classId        = classId;
    d.section        = section;
    d.day            = day;
    d.period         = period;
    return d;
}

std::string where(const std::string& section, int day, int period) {
    std::string s = "секция " + section + ", " + dayName(day);
    if (period >= 0) s += ", урок " + std::to_string(period + 1);
    return s;
}

} // namespace

std::vector<ConflictDetail> findConflicts(
    int classId,
    int academicYearId,
    SessionType sessionType,
    const std::vector<PublishedCell>& scopeCells,
    const std::vector<Constraint>& constraints,
    const std::vector<TeacherAvailability>& teachers
) {
    std::vector<ConflictDetail> result;

    std::map<std::string, std::vector<ScheduleCell>> bySection;
    std::map<std::pair<int, int>, std::vector<const ScheduleCell*>> byTeacherSlot;

    for (const PublishedCell& pc : scopeCells) {
        if (pc.academicYearId != academicYearId || pc.sessionType != sessionType) continue;
        const ScheduleCell& c = pc.cell;
        if (c.classId == classId) bySection[c.section].push_back(c);
        if (isValidSlot(c.day, c.period)) {
            byTeacherSlot[{c.teacherId, slotIndex(c.day, c.period)}].push_back(&c);
        }
    }

    // --- учитель в двух местах одновременно ---
    for (const auto& p : byTeacherSlot) {
        if (p.second.size() <= 1) continue;
        for (const ScheduleCell* mine : p.second) {
            if (mine->classId != classId) continue;
            for (const ScheduleCell* other : p.second) {
                if (other == mine) continue;
                ConflictDetail d = makeDetail(ConflictKind::TeacherDoubleBooked, academicYearId, sessionType,
                                              classId, mine->section, mine->day, mine->period);
                d.teacherId    = mine->teacherId;
                d.subjectId    = mine->subjectId;
                d.otherClassId = other->classId;
                d.otherSection = other->section;
                d.message      = teacherLabel(teachers, mine->teacherId) + " одновременно в " +
                                 where(mine->section, mine->day, mine->period) +
                                 " и в классе " + std::to_string(other->classId) +
                                 ", секция " + other->section;
                result.push_back(d);
            }
        }
    }

    for (const auto& s : bySection) {
        const std::string& section = s.first;
        const std::vector<ScheduleCell>& cells = s.second;
        SectionGrid grid = toSectionGrid(cells);

        // --- дыры в сетке ---
        for (int slot = 0; slot < kSlotsPerWeek; ++slot) {
            if (grid[slot].filled()) continue;
            ConflictDetail d = makeDetail(ConflictKind::EmptySlot, academicYearId, sessionType,
                                          classId, section, slotDay(slot), slotPeriod(slot));
            d.message = "Пустой слот: " + where(section, slotDay(slot), slotPeriod(slot));
            result.push_back(d);
        }

        for (const ScheduleCell& c : cells) {
            if (!isValidSlot(c.day, c.period)) continue;

            // --- запреты ---
            if (const Constraint* f = findForbidding(constraints, classId, c.subjectId, c.teacherId, c.day, c.period)) {
                ConflictDetail d = makeDetail(ConflictKind::ForbiddenViolated, academicYearId, sessionType,
                                              classId, section, c.day, c.period);
                d.teacherId    = c.teacherId;
                d.subjectId    = c.subjectId;
                d.constraintId = f->id;
                d.message      = "Нарушен запрет #" + std::to_string(f->id) + ": " +
                                 where(section, c.day, c.period);
                result.push_back(d);
            }

            // --- доступность учителя должна быть помечена как занятая ---
            const TeacherAvailability* t = findTeacherById(teachers, c.teacherId);
            if (!t || t->grid.state(c.day, c.period) != SlotState::Assigned) {
                ConflictDetail d = makeDetail(ConflictKind::AvailabilityMismatch, academicYearId, sessionType,
                                              classId, section, c.day, c.period);
                d.teacherId = c.teacherId;
                d.subjectId = c.subjectId;
                d.message   = "Сетка доступности " + teacherLabel(teachers, c.teacherId) +
                              " не отмечает занятость в " + where(section, c.day, c.period) +
                              (t ? " (статус " + slotStateToString(t->grid.state(c.day, c.period)) + ")"
                                 : " (учитель не найден)");
                result.push_back(d);
            }
        }

        for (const Constraint& c : constraints) {
            if (c.classId && *c.classId != classId) continue;

            if (c.type == ConstraintType::Required) {
                if (!c.subjectId || !c.day || !c.period || !isValidSlot(*c.day, *c.period)) continue;
                const GridSlot& slot = grid[slotIndex(*c.day, *c.period)];
                if (slot.subjectId == *c.subjectId) continue;

                ConflictDetail d = makeDetail(ConflictKind::RequiredMissing, academicYearId, sessionType,
                                              classId, section, *c.day, *c.period);
                d.subjectId    = *c.subjectId;
                d.teacherId    = slot.teacherId;
                d.constraintId = c.id;
                d.message      = "Ограничение #" + std::to_string(c.id) + " требует предмет #" +
                                 std::to_string(*c.subjectId) + " в " + where(section, *c.day, *c.period);
                result.push_back(d);
                continue;
            }

            if (c.type != ConstraintType::MaxConsecutive && c.type != ConstraintType::MinBreak) continue;

            for (int day = 0; day < kDaysPerWeek; ++day) {
                if (!dayViolates(c, grid, classId, day)) continue;

                bool maxRun = c.type == ConstraintType::MaxConsecutive;
                ConflictDetail d = makeDetail(
                    maxRun ? ConflictKind::MaxConsecutiveExceeded : ConflictKind::MinBreakViolated,
                    academicYearId, sessionType, classId, section, day, -1);
                d.constraintId = c.id;
                if (c.subjectId) d.subjectId = *c.subjectId;
                if (c.teacherId) d.teacherId = *c.teacherId;
                d.message = std::string(maxRun ? "Превышено число уроков подряд" : "Слишком короткий перерыв") +
                            " (ограничение #" + std::to_string(c.id) + ", предел " +
                            std::to_string(c.limit) + "): " + where(section, day, -1);
                result.push_back(d);
            }
        }
    }

    if (!result.empty()) {
        logWarning("Класс " + std::to_string(classId) + ": найдено конфликтов " +
                   std::to_string(result.size()));
    }
    return result;
}
