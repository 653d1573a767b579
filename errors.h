#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "model.h"

// Базовая ошибка движка расписаний. code() уходит в JSON-ответ как есть.
class TimetableError : public std::runtime_error {
public:
    TimetableError(std::string code, const std::string& message)
        : std::runtime_error(message), code_(std::move(code)) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

// Генерация отклонена до начала работы, список всех препятствий
class FeasibilityError : public TimetableError {
public:
    explicit FeasibilityError(FeasibilityReport report);

    const FeasibilityReport& report() const { return report_; }

private:
    FeasibilityReport report_;
};

struct GenerationFailure {
    int classId;
    std::string section;
    int subjectId;
    int teacherId;
    int occurrence;   // какое по счёту занятие не удалось поставить (с 1)
    int missingHours; // сколько часов предмета осталось без места
};

class GenerationError : public TimetableError {
public:
    GenerationError(GenerationFailure failure, const std::string& message)
        : TimetableError("generation_error", message), failure_(failure) {}

    const GenerationFailure& failure() const { return failure_; }

private:
    GenerationFailure failure_;
};

class IntegrityViolation : public TimetableError {
public:
    explicit IntegrityViolation(std::vector<IntegrityIssue> issues);

    const std::vector<IntegrityIssue>& issues() const { return issues_; }

private:
    std::vector<IntegrityIssue> issues_;
};

// reason: "already_published" или "duplicate_name"
class NameConflictError : public TimetableError {
public:
    NameConflictError(std::string reason, const std::string& message)
        : TimetableError("name_conflict", message), reason_(std::move(reason)) {}

    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

class AvailabilityConflictError : public TimetableError {
public:
    explicit AvailabilityConflictError(std::vector<AvailabilityConflict> conflicts);

    const std::vector<AvailabilityConflict>& conflicts() const { return conflicts_; }

private:
    std::vector<AvailabilityConflict> conflicts_;
};

class NotFoundError : public TimetableError {
public:
    explicit NotFoundError(const std::string& message)
        : TimetableError("not_found", message) {}
};

class MalformedAvailabilityError : public TimetableError {
public:
    explicit MalformedAvailabilityError(const std::string& message)
        : TimetableError("malformed_availability", message) {}
};
