#pragma once

#include <array>
#include <vector>

#include "model.h"

// Ячейка сетки одной секции при генерации и анализе
struct GridSlot {
    int subjectId = 0;
    int teacherId = 0;

    bool filled() const { return subjectId > 0; }
};

using SectionGrid = std::array<GridSlot, kSlotsPerWeek>;

SectionGrid toSectionGrid(const std::vector<ScheduleCell>& cells);

// Совпадает ли область ограничения (учитель/предмет/класс) с назначением
bool constraintAppliesTo(const Constraint& c, int classId, int subjectId, int teacherId);

bool constraintCoversSlot(const Constraint& c, int day, int period);

// forbidden/required всегда жёсткие, остальные только с priority 4
bool isHardConstraint(const Constraint& c);

const Constraint* findForbidding(
    const std::vector<Constraint>& constraints,
    int classId, int subjectId, int teacherId,
    int day, int period
);

inline bool isForbidden(
    const std::vector<Constraint>& constraints,
    int classId, int subjectId, int teacherId,
    int day, int period
) {
    return findForbidding(constraints, classId, subjectId, teacherId, day, period) != nullptr;
}

// forbidden без предмета и учителя, закрывающий слот целиком для класса
const Constraint* findClassBlocking(
    const std::vector<Constraint>& constraints,
    int classId, int day, int period
);

std::vector<const Constraint*> requiredConstraintsForClass(
    const std::vector<Constraint>& constraints,
    int classId
);

// Нарушает ли день сетки ограничение max_consecutive / min_break
bool dayViolates(const Constraint& c, const SectionGrid& grid, int classId, int day);

// Нарушит ли ограничение постановка (subject, teacher) в (day, period)
bool placementViolates(
    const Constraint& c, const SectionGrid& grid, int classId,
    int day, int period, int subjectId, int teacherId
);
