#include <optional>
#include <string>
#include <vector>

#pragma once

// --- геометрия учебной недели: воскресенье..четверг, 6 уроков в день ---
constexpr int kDaysPerWeek   = 5;
constexpr int kPeriodsPerDay = 6;
constexpr int kSlotsPerWeek  = kDaysPerWeek * kPeriodsPerDay;

inline int slotIndex(int day, int period) { return day * kPeriodsPerDay + period; }
inline int slotDay(int index)             { return index / kPeriodsPerDay; }
inline int slotPeriod(int index)          { return index % kPeriodsPerDay; }

inline bool isValidSlot(int day, int period) {
    return day >= 0 && day < kDaysPerWeek && period >= 0 && period < kPeriodsPerDay;
}

enum class SessionType {
    Morning,
    Evening
};

std::string sessionTypeToString(SessionType type);
SessionType sessionTypeFromString(const std::string& s); // std::invalid_argument

std::string dayName(int day);

struct SchoolClass {
    int id;
    std::string name;
    int sectionCount;
};

struct Subject {
    int id;
    int classId;
    std::string name;
    int weeklyHours;
};

// Назначение учителя: section пустой => на все секции класса
struct TeacherAssignment {
    int teacherId;
    int subjectId;
    int classId;
    std::optional<std::string> section;
};

struct SubjectRequirement {
    int classId;
    int subjectId;
    int teacherId;
    std::optional<std::string> section;
    int hoursPerSection;
    int weeklyHoursOwed;
    std::vector<std::string> sections; // какие секции покрывает
};

struct ScheduleCell {
    int classId;
    std::string section;
    int day;
    int period;
    int subjectId;
    int teacherId;
};

struct ScheduleGrid {
    int academicYearId;
    SessionType sessionType;
    int classId;
    std::string section;
    std::vector<ScheduleCell> cells;
    std::vector<std::string> warnings; // ослабленные мягкие ограничения
};

// Ключ опубликованного расписания секции
struct ScheduleKey {
    int academicYearId;
    SessionType sessionType;
    int classId;
    std::string section;
};

struct ScheduleRequest {
    int academicYearId;
    SessionType sessionType;
    int classId;
    std::string name; // может быть пустым
    std::optional<std::string> section; // пусто => все секции класса
};

enum class ConstraintType {
    Forbidden,
    Required,
    MaxConsecutive,
    MinBreak
};

std::string constraintTypeToString(ConstraintType type);
ConstraintType constraintTypeFromString(const std::string& s); // std::invalid_argument

struct Constraint {
    int id;
    ConstraintType type;
    std::optional<int> teacherId;
    std::optional<int> subjectId;
    std::optional<int> classId;
    std::optional<int> day;
    std::optional<int> period;
    int limit    = 0; // max_consecutive: длина серии, min_break: уроков между
    int priority = 1; // 1=low .. 4=critical
    std::string description;
};

// --- отчёты, которые отдаются наружу вместе с ошибками ---

enum class ObstructionKind {
    HoursMismatch,
    InsufficientAvailability,
    TeacherOverloaded,
    ForbiddenRemovesLastSlot,
    ForbiddenBlocksClassSlot,
    RequiredSlotUnavailable,
    MalformedConstraint,
    MissingTeacher,
    AmbiguousAssignment
};

std::string obstructionKindToString(ObstructionKind kind);

struct Obstruction {
    ObstructionKind kind;
    int classId;
    std::optional<std::string> section;
    std::optional<int> subjectId;
    std::optional<int> teacherId;
    std::optional<int> constraintId;
    std::optional<int> day;
    std::optional<int> period;
    int required  = 0;
    int available = 0;
    int shortfall = 0;
    std::string message;
};

struct FeasibilityReport {
    bool feasible;
    std::vector<Obstruction> obstructions;
};

struct IntegrityIssue {
    std::string kind; // missing_cell, duplicate_cell, teacher_double_booked, ...
    int classId;
    std::string section;
    int day;
    int period;
    int subjectId;
    int teacherId;
    std::string message;
};

struct AvailabilityConflict {
    int teacherId;
    std::string teacherName;
    int day;
    int period;
};

enum class ConflictKind {
    TeacherDoubleBooked,
    EmptySlot,
    ForbiddenViolated,
    RequiredMissing,
    MaxConsecutiveExceeded,
    MinBreakViolated,
    AvailabilityMismatch
};

std::string conflictKindToString(ConflictKind kind);

struct ConflictDetail {
    ConflictKind kind;
    int academicYearId;
    SessionType sessionType;
    int classId;
    std::string section;
    int day;
    int period;
    int teacherId = 0;
    int subjectId = 0;
    std::optional<int> otherClassId;
    std::optional<std::string> otherSection;
    std::optional<int> constraintId;
    std::string message;
};
