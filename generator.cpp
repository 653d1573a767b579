// generator.cpp
#include "generator.h"

#include "constraints.h"
#include "errors.h"
#include "logger.h"

#include <algorithm>
#include <map>
#include <string>

// --- маленькие хелперы ---

static const SubjectRequirement* findSectionRequirement(
    const std::vector<const SubjectRequirement*>& sectionReqs,
    int subjectId
) {
    for (const SubjectRequirement* r : sectionReqs) {
        if (r->subjectId == subjectId) return r;
    }
    return nullptr;
}

static std::string slotText(int day, int period) {
    return dayName(day) + "/" + std::to_string(period + 1);
}

// Занятые в рабочей копии слоты текущей секции, чтобы откатить их при неудаче
struct SectionPlacement {
    SectionGrid grid{};
    std::vector<std::pair<int, int>> consumed; // (teacherId, slot)
    std::map<int, int> placedPerSubject;
    std::map<std::pair<int, int>, int> perSubjectDay; // (subjectId, day) -> count

    void place(WorkingAvailability& working, int day, int period, int subjectId, int teacherId) {
        int slot = slotIndex(day, period);
        working.consume(teacherId, day, period);
        grid[slot] = GridSlot{subjectId, teacherId};
        consumed.push_back({teacherId, slot});
        placedPerSubject[subjectId]++;
        perSubjectDay[{subjectId, day}]++;
    }

    void rollback(WorkingAvailability& working) {
        for (const auto& c : consumed) {
            working.release(c.first, slotDay(c.second), slotPeriod(c.second));
        }
        consumed.clear();
        grid = SectionGrid{};
        placedPerSubject.clear();
        perSubjectDay.clear();
    }
};

[[noreturn]] static void failPlacement(
    const GenerationInput& input,
    SectionPlacement& placement,
    WorkingAvailability& working,
    const std::string& section,
    int subjectId,
    int teacherId,
    int occurrence,
    int missingHours,
    const std::string& reason
) {
    placement.rollback(working);

    GenerationFailure f;
    f.classId      = input.schoolClass.id;
    f.section      = section;
    f.subjectId    = subjectId;
    f.teacherId    = teacherId;
    f.occurrence   = occurrence;
    f.missingHours = missingHours;

    std::string msg = "Не удалось поставить " + subjectLabel(input.subjects, subjectId) +
                      " (" + teacherLabel(input.teachers, teacherId) + ") в классе " +
                      input.schoolClass.name + ", секция " + section +
                      ": занятие №" + std::to_string(occurrence) +
                      ", без места осталось " + std::to_string(missingHours) + " ч. " + reason;

    logError("[GenerationError] " + msg);
    throw GenerationError(f, msg);
}

// Закреплённые ограничениями required слоты ставим первыми
static void placePinned(
    const GenerationInput& input,
    const std::vector<const SubjectRequirement*>& sectionReqs,
    const std::string& section,
    WorkingAvailability& working,
    SectionPlacement& placement
) {
    int classId = input.schoolClass.id;

    for (const Constraint* c : requiredConstraintsForClass(input.constraints, classId)) {
        if (!c->subjectId || !c->day || !c->period || !isValidSlot(*c->day, *c->period)) continue;

        const SubjectRequirement* r = findSectionRequirement(sectionReqs, *c->subjectId);
        if (!r) continue;

        int day    = *c->day;
        int period = *c->period;
        int occurrence = placement.placedPerSubject[r->subjectId] + 1;
        int missing    = r->hoursPerSection - placement.placedPerSubject[r->subjectId];

        if (placement.placedPerSubject[r->subjectId] >= r->hoursPerSection) {
            failPlacement(input, placement, working, section, r->subjectId, r->teacherId,
                          occurrence, 0, "Закреплённых слотов больше, чем часов предмета");
        }
        if (placement.grid[slotIndex(day, period)].filled()) {
            failPlacement(input, placement, working, section, r->subjectId, r->teacherId,
                          occurrence, missing, "Закреплённый слот " + slotText(day, period) + " уже занят");
        }
        if (!working.isFree(r->teacherId, day, period) ||
            isForbidden(input.constraints, classId, r->subjectId, r->teacherId, day, period)) {
            failPlacement(input, placement, working, section, r->subjectId, r->teacherId,
                          occurrence, missing, "Учитель не свободен в закреплённом слоте " + slotText(day, period));
        }

        placement.place(working, day, period, r->subjectId, r->teacherId);
        logDebug("Секция " + section + ": закреплён " + subjectLabel(input.subjects, r->subjectId) +
                 " в " + slotText(day, period) + " (ограничение #" + std::to_string(c->id) + ")");
    }
}

static bool passes(
    const std::vector<const Constraint*>& list,
    const SectionGrid& grid,
    int classId,
    int day, int period, int subjectId, int teacherId
) {
    for (const Constraint* c : list) {
        if (placementViolates(*c, grid, classId, day, period, subjectId, teacherId)) return false;
    }
    return true;
}

// ============================================================================
//                     РАВНОМЕРНОЕ РАСПРЕДЕЛЕНИЕ ПО НЕДЕЛЕ
// ============================================================================

std::vector<ScheduleGrid> generateClassSchedule(
    const GenerationInput& input,
    const RequirementSet& requirements
) {
    const int classId = input.schoolClass.id;

    logInfo("=== Запуск генерации расписания: класс " + input.schoolClass.name + " ===");
    logInfo("Секций: " + std::to_string(requirements.sections.size()) +
            ", требований: " + std::to_string(requirements.requirements.size()) +
            ", учителей: " + std::to_string(input.teachers.size()));

    std::vector<const Constraint*> hardRules;
    std::vector<const Constraint*> softRules;
    for (const Constraint& c : input.constraints) {
        if (c.type != ConstraintType::MaxConsecutive && c.type != ConstraintType::MinBreak) continue;
        if (c.classId && *c.classId != classId) continue;
        if (isHardConstraint(c)) hardRules.push_back(&c);
        else softRules.push_back(&c);
    }

    WorkingAvailability working(input.teachers);
    std::vector<ScheduleGrid> grids;

    for (const std::string& section : requirements.sections) {
        std::vector<const SubjectRequirement*> sectionReqs = requirementsForSection(requirements, section);

        // сначала «тяжёлые» предметы, при равенстве по id
        std::sort(sectionReqs.begin(), sectionReqs.end(),
            [](const SubjectRequirement* a, const SubjectRequirement* b) {
                if (a->weeklyHoursOwed != b->weeklyHoursOwed) return a->weeklyHoursOwed > b->weeklyHoursOwed;
                return a->subjectId < b->subjectId;
            }
        );

        SectionPlacement placement;
        std::vector<std::string> warnings;

        placePinned(input, sectionReqs, section, working, placement);

        for (const SubjectRequirement* r : sectionReqs) {
            const int subjectId = r->subjectId;
            const int teacherId = r->teacherId;
            const int alreadyPlaced = placement.placedPerSubject[subjectId];

            for (int occurrence = alreadyPlaced + 1; occurrence <= r->hoursPerSection; ++occurrence) {
                std::vector<int> candidates;
                for (int slot = 0; slot < kSlotsPerWeek; ++slot) {
                    int day = slotDay(slot);
                    int period = slotPeriod(slot);
                    if (placement.grid[slot].filled()) continue;
                    if (!working.isFree(teacherId, day, period)) continue;
                    if (isForbidden(input.constraints, classId, subjectId, teacherId, day, period)) continue;
                    if (!passes(hardRules, placement.grid, classId, day, period, subjectId, teacherId)) continue;
                    candidates.push_back(slot);
                }

                if (candidates.empty()) {
                    failPlacement(input, placement, working, section, subjectId, teacherId,
                                  occurrence, r->hoursPerSection - occurrence + 1,
                                  "Нет пустой ячейки, где учитель свободен и слот не запрещён");
                }

                std::vector<int> preferred;
                for (int slot : candidates) {
                    if (passes(softRules, placement.grid, classId, slotDay(slot), slotPeriod(slot), subjectId, teacherId)) {
                        preferred.push_back(slot);
                    }
                }
                if (preferred.empty()) {
                    std::string w = "Секция " + section + ": мягкие ограничения ослаблены для " +
                                    subjectLabel(input.subjects, subjectId) + " (занятие №" +
                                    std::to_string(occurrence) + ")";
                    logWarning(w);
                    warnings.push_back(w);
                    preferred = candidates;
                }

                // меньше всего этого предмета в день -> ранний урок -> ранний день
                int best = preferred.front();
                for (int slot : preferred) {
                    int dayLoad  = placement.perSubjectDay[{subjectId, slotDay(slot)}];
                    int bestLoad = placement.perSubjectDay[{subjectId, slotDay(best)}];
                    if (dayLoad != bestLoad) {
                        if (dayLoad < bestLoad) best = slot;
                        continue;
                    }
                    if (slotPeriod(slot) != slotPeriod(best)) {
                        if (slotPeriod(slot) < slotPeriod(best)) best = slot;
                        continue;
                    }
                    if (slotDay(slot) < slotDay(best)) best = slot;
                }

                placement.place(working, slotDay(best), slotPeriod(best), subjectId, teacherId);

                logDebug("Секция " + section + ": " + subjectLabel(input.subjects, subjectId) +
                         " (" + teacherLabel(input.teachers, teacherId) + ") -> " +
                         slotText(slotDay(best), slotPeriod(best)));
            }
        }

        ScheduleGrid grid;
        grid.academicYearId = input.academicYearId;
        grid.sessionType    = input.sessionType;
        grid.classId        = classId;
        grid.section        = section;
        grid.warnings       = warnings;

        for (int slot = 0; slot < kSlotsPerWeek; ++slot) {
            const GridSlot& g = placement.grid[slot];
            if (!g.filled()) {
                // часов меньше 30: валидатор целостности это поймает
                logWarning("Секция " + section + ": слот " + slotText(slotDay(slot), slotPeriod(slot)) +
                           " остался пустым");
                continue;
            }
            grid.cells.push_back(ScheduleCell{classId, section, slotDay(slot), slotPeriod(slot),
                                              g.subjectId, g.teacherId});
        }

        logInfo("Секция " + section + ": разложено " + std::to_string(grid.cells.size()) + " уроков");
        grids.push_back(std::move(grid));
    }

    logInfo("=== Генерация расписания завершена ===");
    return grids;
}
