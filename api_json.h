#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "api_dto.h"
#include "errors.h"
#include "model.h"
#include "service.h"

// ---- входные данные ----

// std::invalid_argument при неизвестном type или нецелых полях
Constraint constraintFromJson(const nlohmann::json& j);
nlohmann::json constraintToJson(const Constraint& c);

// ---- отчёты и результаты ----

nlohmann::json obstructionToJson(const Obstruction& o);
nlohmann::json feasibilityReportToJson(const FeasibilityReport& report);
nlohmann::json integrityIssueToJson(const IntegrityIssue& issue);
nlohmann::json availabilityConflictToJson(const AvailabilityConflict& c);
nlohmann::json conflictDetailToJson(const ConflictDetail& d);
nlohmann::json conflictsToJson(const std::vector<ConflictDetail>& conflicts);

nlohmann::json gridViewsToJson(const std::vector<ScheduleGridView>& views);
nlohmann::json previewToJson(const Preview& preview);
nlohmann::json weeklyViewToJson(const WeeklyView& view);
nlohmann::json publishResultToJson(const PublishResult& result);
nlohmann::json deleteResultToJson(const DeleteResult& result);
nlohmann::json availabilityViewToJson(const TeacherAvailabilityView& view);

// ---- единый конверт ответа ----
// {"ok":true,"data":...} | {"ok":false,"error":{"code","message","details"}}

nlohmann::json makeOkEnvelope(const nlohmann::json& data);
nlohmann::json makeErrorEnvelope(const std::string& code,
                                 const std::string& message,
                                 const nlohmann::json& details = nlohmann::json::object());

// details заполняются по конкретному типу ошибки
nlohmann::json errorToEnvelope(const TimetableError& error);

int httpStatusForCode(const std::string& code);
