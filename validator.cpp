#include "validator.h"
#include "errors.h"
#include "logger.h"

#include <algorithm>
#include <map>

static std::string cellDescription(const ScheduleCell& c) {
    return "секция " + c.section + ", " + dayName(c.day) +
           ", урок " + std::to_string(c.period + 1);
}

void GridIntegrityValidator::addIssue(
    IntegrityResult& result,
    const std::string& kind,
    const ScheduleCell& cell,
    const std::string& message
) {
    result.ok = false;

    IntegrityIssue issue;
    issue.kind      = kind;
    issue.classId   = cell.classId;
    issue.section   = cell.section;
    issue.day       = cell.day;
    issue.period    = cell.period;
    issue.subjectId = cell.subjectId;
    issue.teacherId = cell.teacherId;
    issue.message   = message;

    result.issues.push_back(issue);
    logError("[Integrity:" + kind + "] " + message);
}

void GridIntegrityValidator::checkAllCellsFilled(
    const std::vector<ScheduleGrid>& grids,
    IntegrityResult& result
) {
    for (const ScheduleGrid& grid : grids) {
        std::vector<int> counts(kSlotsPerWeek, 0);

        for (const ScheduleCell& c : grid.cells) {
            if (!isValidSlot(c.day, c.period)) {
                addIssue(result, "out_of_grid", c,
                         "Ячейка вне сетки (day=" + std::to_string(c.day) +
                         ", period=" + std::to_string(c.period) + ") в секции " + c.section);
                continue;
            }
            if (c.subjectId <= 0 || c.teacherId <= 0) {
                addIssue(result, "empty_cell", c,
                         "Ячейка без предмета или учителя: " + cellDescription(c));
            }
            counts[slotIndex(c.day, c.period)]++;
        }

        for (int slot = 0; slot < kSlotsPerWeek; ++slot) {
            ScheduleCell slotCell{grid.classId, grid.section, slotDay(slot), slotPeriod(slot), 0, 0};

            if (counts[slot] == 0) {
                addIssue(result, "missing_cell", slotCell,
                         "Пустой слот: " + cellDescription(slotCell));
            } else if (counts[slot] > 1) {
                addIssue(result, "duplicate_cell", slotCell,
                         "Слот занят " + std::to_string(counts[slot]) +
                         " раз(а): " + cellDescription(slotCell));
            }
        }
    }
}

void GridIntegrityValidator::checkTeacherConflicts(
    const GenerationInput& input,
    const std::vector<ScheduleGrid>& grids,
    IntegrityResult& result
) {
    // (teacherId, slot) -> ячейки
    std::map<std::pair<int, int>, std::vector<const ScheduleCell*>> table;

    for (const ScheduleGrid& grid : grids) {
        for (const ScheduleCell& c : grid.cells) {
            if (!isValidSlot(c.day, c.period) || c.teacherId <= 0) continue;
            table[{c.teacherId, slotIndex(c.day, c.period)}].push_back(&c);
        }
    }

    for (const auto& p : table) {
        if (p.second.size() <= 1) continue;

        std::string sections;
        for (const ScheduleCell* c : p.second) {
            if (!sections.empty()) sections += ", ";
            sections += c->section;
        }

        for (const ScheduleCell* c : p.second) {
            addIssue(result, "teacher_double_booked", *c,
                     "Конфликт для учителя " + teacherLabel(input.teachers, c->teacherId) +
                     " в " + dayName(c->day) + ", урок " + std::to_string(c->period + 1) +
                     ": одновременно в секциях " + sections);
        }
    }
}

void GridIntegrityValidator::checkCellsMatchRequirements(
    const GenerationInput& input,
    const RequirementSet& requirements,
    const std::vector<ScheduleGrid>& grids,
    IntegrityResult& result
) {
    for (const ScheduleGrid& grid : grids) {
        std::vector<const SubjectRequirement*> sectionReqs = requirementsForSection(requirements, grid.section);
        std::map<int, int> countPerSubject;

        for (const ScheduleCell& c : grid.cells) {
            if (c.classId != grid.classId || c.section != grid.section) {
                addIssue(result, "stray_cell", c,
                         "Ячейка чужой сетки (класс " + std::to_string(c.classId) +
                         ", секция " + c.section + ") в сетке секции " + grid.section);
                continue;
            }

            bool matched = false;
            for (const SubjectRequirement* r : sectionReqs) {
                if (r->subjectId == c.subjectId && r->teacherId == c.teacherId) {
                    matched = true;
                    break;
                }
            }
            if (!matched) {
                addIssue(result, "stray_cell", c,
                         "Пара " + subjectLabel(input.subjects, c.subjectId) + " / " +
                         teacherLabel(input.teachers, c.teacherId) +
                         " не соответствует ни одному требованию: " + cellDescription(c));
                continue;
            }
            countPerSubject[c.subjectId]++;
        }

        for (const SubjectRequirement* r : sectionReqs) {
            int placed = countPerSubject[r->subjectId];
            if (placed == r->hoursPerSection) continue;

            ScheduleCell mismatch{grid.classId, grid.section, -1, -1, r->subjectId, r->teacherId};
            addIssue(result, "hours_mismatch", mismatch,
                     "Предмет " + subjectLabel(input.subjects, r->subjectId) + " в секции " +
                     grid.section + ": поставлено " + std::to_string(placed) +
                     " из " + std::to_string(r->hoursPerSection) + " ч.");
        }
    }
}

void GridIntegrityValidator::checkDeclaredAvailability(
    const GenerationInput& input,
    const std::vector<ScheduleGrid>& grids,
    IntegrityResult& result
) {
    for (const ScheduleGrid& grid : grids) {
        for (const ScheduleCell& c : grid.cells) {
            if (!isValidSlot(c.day, c.period) || c.teacherId <= 0) continue;

            const TeacherAvailability* t = findTeacherById(input.teachers, c.teacherId);
            if (t && t->grid.isFree(c.day, c.period)) continue;

            addIssue(result, "teacher_unavailable", c,
                     "Учитель " + teacherLabel(input.teachers, c.teacherId) +
                     " поставлен в несвободный слот: " + cellDescription(c));
        }
    }
}

IntegrityResult GridIntegrityValidator::checkAll(
    const GenerationInput& input,
    const RequirementSet& requirements,
    const std::vector<ScheduleGrid>& grids
) {
    IntegrityResult result;
    result.ok = true;

    size_t cellCount = 0;
    for (const ScheduleGrid& g : grids) cellCount += g.cells.size();

    logInfo("=== Проверка целостности сеток ===");
    logInfo("Сеток: " + std::to_string(grids.size()) +
            ", ячеек: " + std::to_string(cellCount) +
            ", требований: " + std::to_string(requirements.requirements.size()));

    if (grids.size() != requirements.sections.size()) {
        result.ok = false;
        IntegrityIssue issue;
        issue.kind      = "missing_grid";
        issue.classId   = input.schoolClass.id;
        issue.day       = -1;
        issue.period    = -1;
        issue.subjectId = 0;
        issue.teacherId = 0;
        issue.message   = "Ожидалось сеток: " + std::to_string(requirements.sections.size()) +
                          ", получено: " + std::to_string(grids.size());
        result.issues.push_back(issue);
        logError("[Integrity:missing_grid] " + issue.message);
    }

    checkAllCellsFilled(grids, result);
    checkTeacherConflicts(input, grids, result);
    checkCellsMatchRequirements(input, requirements, grids, result);
    checkDeclaredAvailability(input, grids, result);

    if (result.ok) {
        logInfo("Проверка целостности завершена: нарушений не обнаружено.");
    } else {
        logError("Проверка целостности завершена: нарушений = " +
                 std::to_string(result.issues.size()));
    }

    return result;
}

void GridIntegrityValidator::enforce(
    const GenerationInput& input,
    const RequirementSet& requirements,
    const std::vector<ScheduleGrid>& grids
) {
    IntegrityResult result = checkAll(input, requirements, grids);
    if (!result.ok) {
        throw IntegrityViolation(std::move(result.issues));
    }
}
