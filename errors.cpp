#include "errors.h"

static std::string describeFeasibility(const FeasibilityReport& report) {
    std::string msg = "Генерация невозможна: препятствий " +
                      std::to_string(report.obstructions.size());
    if (!report.obstructions.empty()) {
        msg += " (первое: " + report.obstructions.front().message + ")";
    }
    return msg;
}

FeasibilityError::FeasibilityError(FeasibilityReport report)
    : TimetableError("feasibility_error", describeFeasibility(report)),
      report_(std::move(report)) {}

IntegrityViolation::IntegrityViolation(std::vector<IntegrityIssue> issues)
    : TimetableError(
          "integrity_violation",
          "Проверка целостности сетки не пройдена: нарушений " + std::to_string(issues.size())),
      issues_(std::move(issues)) {}

static std::string describeConflicts(const std::vector<AvailabilityConflict>& conflicts) {
    std::string msg = "Слоты преподавателей уже заняты другим расписанием:";
    for (const AvailabilityConflict& c : conflicts) {
        msg += " " + c.teacherName + " (" + dayName(c.day) +
               ", урок " + std::to_string(c.period + 1) + ");";
    }
    return msg;
}

AvailabilityConflictError::AvailabilityConflictError(std::vector<AvailabilityConflict> conflicts)
    : TimetableError("availability_conflict", describeConflicts(conflicts)),
      conflicts_(std::move(conflicts)) {}
