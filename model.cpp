#include "model.h"

#include <stdexcept>

std::string sessionTypeToString(SessionType type) {
    switch (type) {
        case SessionType::Morning: return "morning";
        case SessionType::Evening: return "evening";
    }
    return "unknown";
}

SessionType sessionTypeFromString(const std::string& s) {
    if (s == "morning") return SessionType::Morning;
    if (s == "evening") return SessionType::Evening;
    throw std::invalid_argument("Unknown session type: " + s);
}

std::string dayName(int day) {
    static const char* names[kDaysPerWeek] = {
        "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday"
    };
    if (day < 0 || day >= kDaysPerWeek) return "day#" + std::to_string(day);
    return names[day];
}

std::string constraintTypeToString(ConstraintType type) {
    switch (type) {
        case ConstraintType::Forbidden:      return "forbidden";
        case ConstraintType::Required:       return "required";
        case ConstraintType::MaxConsecutive: return "max_consecutive";
        case ConstraintType::MinBreak:       return "min_break";
    }
    return "unknown";
}

ConstraintType constraintTypeFromString(const std::string& s) {
    if (s == "forbidden")       return ConstraintType::Forbidden;
    if (s == "required")        return ConstraintType::Required;
    if (s == "max_consecutive") return ConstraintType::MaxConsecutive;
    if (s == "no_consecutive")  return ConstraintType::MaxConsecutive; // старое имя, limit = 1
    if (s == "min_break")       return ConstraintType::MinBreak;
    throw std::invalid_argument("Unknown constraint type: " + s);
}

std::string obstructionKindToString(ObstructionKind kind) {
    switch (kind) {
        case ObstructionKind::HoursMismatch:            return "hours_mismatch";
        case ObstructionKind::InsufficientAvailability: return "insufficient_availability";
        case ObstructionKind::TeacherOverloaded:        return "teacher_overloaded";
        case ObstructionKind::ForbiddenRemovesLastSlot: return "forbidden_removes_last_slot";
        case ObstructionKind::ForbiddenBlocksClassSlot: return "forbidden_blocks_class_slot";
        case ObstructionKind::RequiredSlotUnavailable:  return "required_slot_unavailable";
        case ObstructionKind::MalformedConstraint:      return "malformed_constraint";
        case ObstructionKind::MissingTeacher:           return "missing_teacher";
        case ObstructionKind::AmbiguousAssignment:      return "ambiguous_assignment";
    }
    return "unknown";
}

std::string conflictKindToString(ConflictKind kind) {
    switch (kind) {
        case ConflictKind::TeacherDoubleBooked:    return "teacher_double_booked";
        case ConflictKind::EmptySlot:              return "empty_slot";
        case ConflictKind::ForbiddenViolated:      return "forbidden_violated";
        case ConflictKind::RequiredMissing:        return "required_missing";
        case ConflictKind::MaxConsecutiveExceeded: return "max_consecutive_exceeded";
        case ConflictKind::MinBreakViolated:       return "min_break_violated";
        case ConflictKind::AvailabilityMismatch:   return "availability_mismatch";
    }
    return "unknown";
}
