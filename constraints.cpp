#include "constraints.h"

SectionGrid toSectionGrid(const std::vector<ScheduleCell>& cells) {
    SectionGrid grid{};
    for (const ScheduleCell& c : cells) {
        if (!isValidSlot(c.day, c.period)) continue;
        GridSlot& slot = grid[slotIndex(c.day, c.period)];
        slot.subjectId = c.subjectId;
        slot.teacherId = c.teacherId;
    }
    return grid;
}

bool constraintAppliesTo(const Constraint& c, int classId, int subjectId, int teacherId) {
    if (c.classId && *c.classId != classId) return false;
    if (c.subjectId && *c.subjectId != subjectId) return false;
    if (c.teacherId && *c.teacherId != teacherId) return false;
    return true;
}

bool constraintCoversSlot(const Constraint& c, int day, int period) {
    if (c.day && *c.day != day) return false;
    if (c.period && *c.period != period) return false;
    return true;
}

bool isHardConstraint(const Constraint& c) {
    if (c.type == ConstraintType::Forbidden || c.type == ConstraintType::Required) return true;
    return c.priority >= 4;
}

const Constraint* findForbidding(
    const std::vector<Constraint>& constraints,
    int classId, int subjectId, int teacherId,
    int day, int period
) {
    for (const Constraint& c : constraints) {
        if (c.type != ConstraintType::Forbidden) continue;
        if (!constraintCoversSlot(c, day, period)) continue;
        if (constraintAppliesTo(c, classId, subjectId, teacherId)) return &c;
    }
    return nullptr;
}

const Constraint* findClassBlocking(
    const std::vector<Constraint>& constraints,
    int classId, int day, int period
) {
    for (const Constraint& c : constraints) {
        if (c.type != ConstraintType::Forbidden) continue;
        if (c.subjectId || c.teacherId) continue;
        if (c.classId && *c.classId != classId) continue;
        if (constraintCoversSlot(c, day, period)) return &c;
    }
    return nullptr;
}

std::vector<const Constraint*> requiredConstraintsForClass(
    const std::vector<Constraint>& constraints,
    int classId
) {
    std::vector<const Constraint*> out;
    for (const Constraint& c : constraints) {
        if (c.type != ConstraintType::Required) continue;
        if (c.classId && *c.classId != classId) continue;
        out.push_back(&c);
    }
    return out;
}

static bool slotMatches(const Constraint& c, const GridSlot& slot, int classId) {
    return slot.filled() && constraintAppliesTo(c, classId, slot.subjectId, slot.teacherId);
}

bool dayViolates(const Constraint& c, const SectionGrid& grid, int classId, int day) {
    if (c.day && *c.day != day) return false;

    if (c.type == ConstraintType::MaxConsecutive) {
        int limit = c.limit > 0 ? c.limit : 1;
        int run = 0;
        for (int p = 0; p < kPeriodsPerDay; ++p) {
            if (slotMatches(c, grid[slotIndex(day, p)], classId)) {
                if (++run > limit) return true;
            } else {
                run = 0;
            }
        }
        return false;
    }

    if (c.type == ConstraintType::MinBreak) {
        int last = -1;
        for (int p = 0; p < kPeriodsPerDay; ++p) {
            if (!slotMatches(c, grid[slotIndex(day, p)], classId)) continue;
            if (last >= 0 && (p - last - 1) < c.limit) return true;
            last = p;
        }
        return false;
    }

    return false;
}

bool placementViolates(
    const Constraint& c, const SectionGrid& grid, int classId,
    int day, int period, int subjectId, int teacherId
) {
    if (c.type != ConstraintType::MaxConsecutive && c.type != ConstraintType::MinBreak) return false;
    if (!constraintAppliesTo(c, classId, subjectId, teacherId)) return false;

    SectionGrid candidate = grid;
    candidate[slotIndex(day, period)] = GridSlot{subjectId, teacherId};
    return dayViolates(c, candidate, classId, day);
}
