#include "feasibility.h"
#include "constraints.h"
#include "logger.h"

#include <map>
#include <set>

// Свободные ячейки учителя, куда предмет вообще можно поставить
static int countEligible(
    const GenerationInput& input,
    const AvailabilityGrid& grid,
    int subjectId,
    int teacherId,
    std::set<int>* blockingConstraintIds
) {
    int classId = input.schoolClass.id;
    int n = 0;
    for (int day = 0; day < kDaysPerWeek; ++day) {
        for (int period = 0; period < kPeriodsPerDay; ++period) {
            if (!grid.isFree(day, period)) continue;
            const Constraint* c = findForbidding(input.constraints, classId, subjectId, teacherId, day, period);
            if (c) {
                if (blockingConstraintIds) blockingConstraintIds->insert(c->id);
                continue;
            }
            ++n;
        }
    }
    return n;
}

void FeasibilityValidator::add(FeasibilityReport& report, const Obstruction& o) {
    report.feasible = false;
    report.obstructions.push_back(o);
    logWarning("[Feasibility:" + obstructionKindToString(o.kind) + "] " + o.message);
}

void FeasibilityValidator::checkWeeklyHours(
    const GenerationInput& input,
    FeasibilityReport& report
) {
    // Все секции класса несут один и тот же набор предметов,
    // поэтому сумма одна на класс
    int total = 0;
    for (const Subject& s : input.subjects) {
        if (s.classId != input.schoolClass.id || s.weeklyHours <= 0) continue;
        total += s.weeklyHours;
    }

    if (total != kSlotsPerWeek) {
        Obstruction o;
        o.kind      = ObstructionKind::HoursMismatch;
        o.classId   = input.schoolClass.id;
        o.required  = kSlotsPerWeek;
        o.available = total;
        o.shortfall = kSlotsPerWeek - total;
        o.message   = "Сумма недельных часов класса " + input.schoolClass.name +
                      " равна " + std::to_string(total) + ", а должна быть ровно " +
                      std::to_string(kSlotsPerWeek);
        add(report, o);
    }
}

void FeasibilityValidator::checkTeacherCapacity(
    const GenerationInput& input,
    const RequirementSet& requirements,
    FeasibilityReport& report
) {
    // (teacherId, subjectId) -> часы
    std::map<std::pair<int, int>, int> pairing;
    std::map<int, int> perTeacher;

    for (const SubjectRequirement& r : requirements.requirements) {
        pairing[{r.teacherId, r.subjectId}] += r.weeklyHoursOwed;
        perTeacher[r.teacherId] += r.weeklyHoursOwed;
    }

    for (const auto& p : pairing) {
        int teacherId = p.first.first;
        int subjectId = p.first.second;
        int owed      = p.second;

        const TeacherAvailability* t = findTeacherById(input.teachers, teacherId);
        int eligible = t ? countEligible(input, t->grid, subjectId, teacherId, nullptr) : 0;

        if (eligible < owed) {
            Obstruction o;
            o.kind      = ObstructionKind::InsufficientAvailability;
            o.classId   = input.schoolClass.id;
            o.subjectId = subjectId;
            o.teacherId = teacherId;
            o.required  = owed;
            o.available = eligible;
            o.shortfall = owed - eligible;
            o.message   = "Гарантированно пустой слот: " +
                          teacherLabel(input.teachers, teacherId) + " может вести " +
                          subjectLabel(input.subjects, subjectId) + " только в " +
                          std::to_string(eligible) + " слотах из нужных " +
                          std::to_string(owed) + " (не хватает " +
                          std::to_string(owed - eligible) + ")";
            if (!t) o.message += ", учитель не найден в каталоге";
            add(report, o);
        }
    }

    for (const auto& p : perTeacher) {
        int teacherId = p.first;
        int owed      = p.second;

        const TeacherAvailability* t = findTeacherById(input.teachers, teacherId);
        int freeCells = t ? t->grid.countFree() : 0;

        if (freeCells < owed) {
            Obstruction o;
            o.kind      = ObstructionKind::TeacherOverloaded;
            o.classId   = input.schoolClass.id;
            o.teacherId = teacherId;
            o.required  = owed;
            o.available = freeCells;
            o.shortfall = owed - freeCells;
            o.message   = teacherLabel(input.teachers, teacherId) + " должен провести " +
                          std::to_string(owed) + " уроков, но свободен только " +
                          std::to_string(freeCells) + " (не хватает " +
                          std::to_string(owed - freeCells) + ")";
            add(report, o);
        }
    }
}

void FeasibilityValidator::checkForbiddenConstraints(
    const GenerationInput& input,
    const RequirementSet& requirements,
    FeasibilityReport& report
) {
    int classId = input.schoolClass.id;

    // Слот, закрытый для всего класса, не может быть заполнен
    for (int day = 0; day < kDaysPerWeek; ++day) {
        for (int period = 0; period < kPeriodsPerDay; ++period) {
            const Constraint* c = findClassBlocking(input.constraints, classId, day, period);
            if (!c) continue;

            Obstruction o;
            o.kind         = ObstructionKind::ForbiddenBlocksClassSlot;
            o.classId      = classId;
            o.constraintId = c->id;
            o.day          = day;
            o.period       = period;
            o.required     = 1;
            o.shortfall    = 1;
            o.message      = "Ограничение #" + std::to_string(c->id) + " закрывает " +
                             dayName(day) + ", урок " + std::to_string(period + 1) +
                             " для всего класса, а сетка должна быть заполнена целиком";
            add(report, o);
        }
    }

    std::map<std::pair<int, int>, int> pairing;
    for (const SubjectRequirement& r : requirements.requirements) {
        pairing[{r.teacherId, r.subjectId}] += r.weeklyHoursOwed;
    }

    for (const auto& p : pairing) {
        int teacherId = p.first.first;
        int subjectId = p.first.second;
        int owed      = p.second;

        const TeacherAvailability* t = findTeacherById(input.teachers, teacherId);
        if (!t) continue;

        int freeCells = t->grid.countFree();
        if (freeCells < owed) continue; // уже нехватка по количеству, не вина ограничений

        std::set<int> blocking;
        int eligible = countEligible(input, t->grid, subjectId, teacherId, &blocking);
        if (eligible >= owed) continue;

        for (int constraintId : blocking) {
            Obstruction o;
            o.kind         = ObstructionKind::ForbiddenRemovesLastSlot;
            o.classId      = classId;
            o.subjectId    = subjectId;
            o.teacherId    = teacherId;
            o.constraintId = constraintId;
            o.required     = owed;
            o.available    = eligible;
            o.shortfall    = owed - eligible;
            o.message      = "Запрет #" + std::to_string(constraintId) + " отнимает последние слоты: " +
                             subjectLabel(input.subjects, subjectId) + " (" +
                             teacherLabel(input.teachers, teacherId) + ") остаётся " +
                             std::to_string(eligible) + " из " + std::to_string(owed);
            add(report, o);
        }
    }
}

void FeasibilityValidator::checkRequiredConstraints(
    const GenerationInput& input,
    const RequirementSet& requirements,
    FeasibilityReport& report
) {
    int classId = input.schoolClass.id;
    std::map<int, int> ownerOfSlot;        // slot -> constraintId
    std::map<int, int> pinnedPerSubject;   // subjectId -> кол-во закреплённых слотов

    for (const Constraint* c : requiredConstraintsForClass(input.constraints, classId)) {
        if (!c->subjectId || !c->day || !c->period || !isValidSlot(*c->day, *c->period)) {
            Obstruction o;
            o.kind         = ObstructionKind::MalformedConstraint;
            o.classId      = classId;
            o.constraintId = c->id;
            o.message      = "Ограничение required #" + std::to_string(c->id) +
                             " должно указывать предмет, день и урок";
            add(report, o);
            continue;
        }

        int subjectId = *c->subjectId;
        int day       = *c->day;
        int period    = *c->period;
        int slot      = slotIndex(day, period);

        auto makeObstruction = [&](const std::string& msg, std::optional<int> teacherId) {
            Obstruction o;
            o.kind         = ObstructionKind::RequiredSlotUnavailable;
            o.classId      = classId;
            o.subjectId    = subjectId;
            o.teacherId    = teacherId;
            o.constraintId = c->id;
            o.day          = day;
            o.period       = period;
            o.required     = 1;
            o.shortfall    = 1;
            o.message      = msg;
            return o;
        };

        std::string where = dayName(day) + ", урок " + std::to_string(period + 1);

        auto owner = ownerOfSlot.find(slot);
        if (owner != ownerOfSlot.end()) {
            add(report, makeObstruction(
                "Ограничения #" + std::to_string(owner->second) + " и #" + std::to_string(c->id) +
                " требуют один и тот же слот " + where, std::nullopt));
            continue;
        }
        ownerOfSlot[slot] = c->id;
        pinnedPerSubject[subjectId]++;

        bool anyRequirement = false;
        int hoursPerSection = 0;
        std::map<int, int> sectionsPerTeacher;

        for (const SubjectRequirement& r : requirements.requirements) {
            if (r.subjectId != subjectId) continue;
            anyRequirement = true;
            hoursPerSection = r.hoursPerSection;
            sectionsPerTeacher[r.teacherId] += (int)r.sections.size();
        }

        if (!anyRequirement) {
            add(report, makeObstruction(
                "Ограничение #" + std::to_string(c->id) + " закрепляет предмет " +
                subjectLabel(input.subjects, subjectId) + ", которого нет в требованиях класса",
                std::nullopt));
            continue;
        }

        // одно препятствие на ограничение, сколько бы секций ни было
        if (pinnedPerSubject[subjectId] > hoursPerSection) {
            add(report, makeObstruction(
                "Для предмета " + subjectLabel(input.subjects, subjectId) +
                " закреплено больше слотов, чем его недельных часов (" +
                std::to_string(hoursPerSection) + ")", std::nullopt));
        }

        for (const auto& st : sectionsPerTeacher) {
            int teacherId = st.first;
            const TeacherAvailability* t = findTeacherById(input.teachers, teacherId);

            if (!t || !t->grid.isFree(day, period)) {
                add(report, makeObstruction(
                    teacherLabel(input.teachers, teacherId) + " не свободен в " + where +
                    ", куда закреплён предмет " + subjectLabel(input.subjects, subjectId),
                    teacherId));
            }
            if (const Constraint* f = findForbidding(input.constraints, classId, subjectId, teacherId, day, period)) {
                add(report, makeObstruction(
                    "Слот " + where + " одновременно закреплён (#" + std::to_string(c->id) +
                    ") и запрещён (#" + std::to_string(f->id) + ")", teacherId));
            }
            if (st.second > 1) {
                add(report, makeObstruction(
                    teacherLabel(input.teachers, teacherId) + " должен быть в " +
                    std::to_string(st.second) + " секциях одновременно в " + where,
                    teacherId));
            }
        }
    }
}

void FeasibilityValidator::checkAssignments(
    const RequirementSet& requirements,
    FeasibilityReport& report
) {
    for (const Obstruction& o : requirements.assignmentIssues) {
        add(report, o);
    }
}

FeasibilityReport FeasibilityValidator::checkAll(
    const GenerationInput& input,
    const RequirementSet& requirements
) {
    FeasibilityReport report;
    report.feasible = true;

    logInfo("=== Проверка выполнимости: класс " + input.schoolClass.name +
            " (id=" + std::to_string(input.schoolClass.id) + ") ===");
    logInfo("Предметов: " + std::to_string(input.subjects.size()) +
            ", требований: " + std::to_string(requirements.requirements.size()) +
            ", учителей: " + std::to_string(input.teachers.size()) +
            ", ограничений: " + std::to_string(input.constraints.size()));

    checkWeeklyHours(input, report);
    checkTeacherCapacity(input, requirements, report);
    checkForbiddenConstraints(input, requirements, report);
    checkRequiredConstraints(input, requirements, report);
    checkAssignments(requirements, report);

    if (report.feasible) {
        logInfo("Проверка выполнимости пройдена");
    } else {
        logWarning("Генерация невозможна, препятствий: " +
                   std::to_string(report.obstructions.size()));
    }

    return report;
}
