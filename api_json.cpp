#include "api_json.h"

#include <stdexcept>

using nlohmann::json;

// --- разбор ограничений ---

static std::optional<int> optionalInt(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_number_integer()) {
        throw std::invalid_argument(std::string("Поле ") + key + " должно быть целым");
    }
    return j[key].get<int>();
}

template <typename T>
static void putOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
    else j[key] = nullptr;
}

Constraint constraintFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Ограничение должно быть объектом");
    }

    std::string typeStr = j.value("type", std::string(""));

    Constraint c;
    c.id          = j.value("id", 0);
    c.type        = constraintTypeFromString(typeStr);
    c.teacherId   = optionalInt(j, "teacherId");
    c.subjectId   = optionalInt(j, "subjectId");
    c.classId     = optionalInt(j, "classId");
    c.day         = optionalInt(j, "day");
    c.period      = optionalInt(j, "period");
    c.limit       = j.value("limit", typeStr == "no_consecutive" ? 1 : 0);
    c.priority    = j.value("priority", 1);
    c.description = j.value("description", std::string(""));
    return c;
}

json constraintToJson(const Constraint& c) {
    json j = {
        {"id", c.id},
        {"type", constraintTypeToString(c.type)},
        {"limit", c.limit},
        {"priority", c.priority},
        {"description", c.description}
    };
    putOptional(j, "teacherId", c.teacherId);
    putOptional(j, "subjectId", c.subjectId);
    putOptional(j, "classId", c.classId);
    putOptional(j, "day", c.day);
    putOptional(j, "period", c.period);
    return j;
}

// --- отчёты ---

json obstructionToJson(const Obstruction& o) {
    json j = {
        {"kind", obstructionKindToString(o.kind)},
        {"classId", o.classId},
        {"required", o.required},
        {"available", o.available},
        {"shortfall", o.shortfall},
        {"message", o.message}
    };
    putOptional(j, "section", o.section);
    putOptional(j, "subjectId", o.subjectId);
    putOptional(j, "teacherId", o.teacherId);
    putOptional(j, "constraintId", o.constraintId);
    putOptional(j, "day", o.day);
    putOptional(j, "period", o.period);
    return j;
}

json feasibilityReportToJson(const FeasibilityReport& report) {
    json arr = json::array();
    for (const Obstruction& o : report.obstructions) {
        arr.push_back(obstructionToJson(o));
    }
    return json{
        {"feasible", report.feasible},
        {"obstructions", arr}
    };
}

json integrityIssueToJson(const IntegrityIssue& issue) {
    return json{
        {"kind", issue.kind},
        {"classId", issue.classId},
        {"section", issue.section},
        {"day", issue.day},
        {"period", issue.period},
        {"subjectId", issue.subjectId},
        {"teacherId", issue.teacherId},
        {"message", issue.message}
    };
}

json availabilityConflictToJson(const AvailabilityConflict& c) {
    return json{
        {"teacherId", c.teacherId},
        {"teacherName", c.teacherName},
        {"day", c.day},
        {"dayName", dayName(c.day)},
        {"period", c.period}
    };
}

json conflictDetailToJson(const ConflictDetail& d) {
    json j = {
        {"kind", conflictKindToString(d.kind)},
        {"academicYearId", d.academicYearId},
        {"sessionType", sessionTypeToString(d.sessionType)},
        {"classId", d.classId},
        {"section", d.section},
        {"day", d.day},
        {"period", d.period}, // -1: нарушение относится ко всему дню
        {"teacherId", d.teacherId},
        {"subjectId", d.subjectId},
        {"message", d.message}
    };
    putOptional(j, "otherClassId", d.otherClassId);
    putOptional(j, "otherSection", d.otherSection);
    putOptional(j, "constraintId", d.constraintId);
    return j;
}

json conflictsToJson(const std::vector<ConflictDetail>& conflicts) {
    json arr = json::array();
    for (const ConflictDetail& d : conflicts) {
        arr.push_back(conflictDetailToJson(d));
    }
    return json{
        {"count", conflicts.size()},
        {"conflicts", arr}
    };
}

// --- сетки ---

json gridViewsToJson(const std::vector<ScheduleGridView>& views) {
    json arr = json::array();
    for (const ScheduleGridView& gv : views) {
        json cells = json::array();
        for (const ScheduleCellView& c : gv.cells) {
            cells.push_back({
                {"classId", c.classId},
                {"section", c.section},
                {"day", c.day},
                {"dayName", c.dayName},
                {"period", c.period},
                {"subjectId", c.subjectId},
                {"subjectName", c.subjectName},
                {"teacherId", c.teacherId},
                {"teacherName", c.teacherName}
            });
        }
        arr.push_back({
            {"classId", gv.classId},
            {"section", gv.section},
            {"name", gv.name},
            {"cells", cells},
            {"warnings", gv.warnings}
        });
    }
    return arr;
}

json previewToJson(const Preview& preview) {
    std::vector<ScheduleGridView> views =
        buildGridViews(preview.grids, preview.input.subjects, preview.input.teachers);

    return json{
        {"previewToken", preview.token},
        {"state", previewStateToString(preview.state)},
        {"academicYearId", preview.request.academicYearId},
        {"sessionType", sessionTypeToString(preview.request.sessionType)},
        {"classId", preview.request.classId},
        {"className", preview.input.schoolClass.name},
        {"name", preview.request.name},
        {"section", preview.request.section ? json(*preview.request.section) : json(nullptr)},
        {"grids", gridViewsToJson(views)}
    };
}

json weeklyViewToJson(const WeeklyView& view) {
    return json{
        {"academicYearId", view.academicYearId},
        {"sessionType", sessionTypeToString(view.sessionType)},
        {"classId", view.classId ? json(*view.classId) : json(nullptr)},
        {"teacherId", view.teacherId ? json(*view.teacherId) : json(nullptr)},
        {"totalCells", view.totalCells},
        {"grids", gridViewsToJson(view.grids)}
    };
}

json publishResultToJson(const PublishResult& result) {
    return json{
        {"publishedCount", result.publishedCount},
        {"sections", result.sections},
        {"teachersUpdated", result.teachersUpdated}
    };
}

json deleteResultToJson(const DeleteResult& result) {
    return json{
        {"deletedCount", result.deletedCount},
        {"restoredTeachers", result.restoredTeachers}
    };
}

json availabilityViewToJson(const TeacherAvailabilityView& view) {
    return json{
        {"teacherId", view.teacherId},
        {"teacherName", view.teacherName},
        {"grid", availabilityToJson(view.grid)},
        {"totalFree", view.totalFree},
        {"totalAssigned", view.totalAssigned},
        {"totalUnavailable", view.totalUnavailable}
    };
}

// --- конверт ---

json makeOkEnvelope(const json& data) {
    return json{
        {"ok", true},
        {"data", data}
    };
}

json makeErrorEnvelope(const std::string& code, const std::string& message, const json& details) {
    return json{
        {"ok", false},
        {"error", {
            {"code", code},
            {"message", message},
            {"details", details}
        }}
    };
}

json errorToEnvelope(const TimetableError& error) {
    json details = json::object();

    if (auto fe = dynamic_cast<const FeasibilityError*>(&error)) {
        details = feasibilityReportToJson(fe->report());
    } else if (auto ge = dynamic_cast<const GenerationError*>(&error)) {
        const GenerationFailure& f = ge->failure();
        details = {
            {"classId", f.classId},
            {"section", f.section},
            {"subjectId", f.subjectId},
            {"teacherId", f.teacherId},
            {"occurrence", f.occurrence},
            {"missingHours", f.missingHours}
        };
    } else if (auto iv = dynamic_cast<const IntegrityViolation*>(&error)) {
        json arr = json::array();
        for (const IntegrityIssue& issue : iv->issues()) {
            arr.push_back(integrityIssueToJson(issue));
        }
        details = {{"issues", arr}};
    } else if (auto nc = dynamic_cast<const NameConflictError*>(&error)) {
        details = {{"reason", nc->reason()}};
    } else if (auto ac = dynamic_cast<const AvailabilityConflictError*>(&error)) {
        json arr = json::array();
        for (const AvailabilityConflict& c : ac->conflicts()) {
            arr.push_back(availabilityConflictToJson(c));
        }
        details = {{"conflicts", arr}};
    }

    return makeErrorEnvelope(error.code(), error.what(), details);
}

int httpStatusForCode(const std::string& code) {
    if (code == "feasibility_error")      return 422;
    if (code == "malformed_availability") return 422;
    if (code == "name_conflict")          return 409;
    if (code == "availability_conflict")  return 409;
    if (code == "not_found")              return 404;
    if (code == "bad_request")            return 400;
    if (code == "unauthorized")           return 401;
    if (code == "forbidden")              return 403;
    return 500; // generation_error, integrity_violation, internal_error
}
