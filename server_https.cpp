#define CPPHTTPLIB_OPENSSL_SUPPORT

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <optional>
#include <cstdlib>
#include <cctype>
#include <chrono>
#include <functional>

#include "api_json.h"
#include "config.h"
#include "db.h"
#include "errors.h"
#include "jwt_utils.h"
#include "logger.h"
#include "model.h"
#include "service.h"

using nlohmann::json;

static const char* kJsonContentType = "application/json; charset=utf-8";

// --------- ответы ---------

static void setCors(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
}

static void sendOk(httplib::Response& res, const json& data, int status = 200) {
    res.status = status;
    res.set_content(makeOkEnvelope(data).dump(), kJsonContentType);
}

static void sendError(httplib::Response& res, const std::string& code, const std::string& message,
                      const json& details = json::object()) {
    res.status = httpStatusForCode(code);
    res.set_content(makeErrorEnvelope(code, message, details).dump(), kJsonContentType);
}

// Общая обёртка маршрута: CORS + перевод исключений в конверт ошибки
static void runRoute(const std::string& routeName, httplib::Response& res, const std::function<void()>& body) {
    setCors(res);
    try {
        body();
    } catch (const TimetableError& ex) {
        logWarning(routeName + ": " + ex.code() + ": " + ex.what());
        json envelope = errorToEnvelope(ex);
        res.status = httpStatusForCode(ex.code());
        res.set_content(envelope.dump(), kJsonContentType);
    } catch (const json::exception& ex) {
        logWarning(routeName + ": invalid json: " + ex.what());
        sendError(res, "bad_request", std::string("Некорректный JSON: ") + ex.what());
    } catch (const std::invalid_argument& ex) {
        logWarning(routeName + ": bad request: " + ex.what());
        sendError(res, "bad_request", ex.what());
    } catch (const std::exception& ex) {
        logError(routeName + ": " + ex.what());
        sendError(res, "internal_error", "Внутренняя ошибка сервера");
    }
}

// --------- JWT helpers ---------

static std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

static std::optional<std::string> getTokenFromCookie(const std::string& cookieHeader) {
    // Cookie: key1=val1; auth_token=...; other=...
    size_t pos = 0;
    while (pos < cookieHeader.size()) {
        size_t sep = cookieHeader.find(';', pos);
        std::string part = (sep == std::string::npos)
            ? cookieHeader.substr(pos)
            : cookieHeader.substr(pos, sep - pos);

        part = trim(part);
        const std::string prefix = "auth_token=";
        if (part.rfind(prefix, 0) == 0) {
            return part.substr(prefix.size());
        }

        if (sep == std::string::npos) break;
        pos = sep + 1;
    }
    return std::nullopt;
}

static std::optional<std::string> getTokenFromAuthorization(const std::string& authHeader) {
    // Authorization: Bearer <token>
    const std::string bearer = "Bearer ";
    if (authHeader.rfind(bearer, 0) == 0) {
        return authHeader.substr(bearer.size());
    }
    return std::nullopt;
}

static std::optional<JwtPayload> getUserFromRequest(
    const httplib::Request& req,
    const std::string& jwtSecret
) {
    std::optional<std::string> token;

    auto itAuth = req.headers.find("Authorization");
    if (itAuth != req.headers.end()) {
        token = getTokenFromAuthorization(itAuth->second);
    }

    if (!token.has_value()) {
        auto itCookie = req.headers.find("Cookie");
        if (itCookie != req.headers.end()) {
            token = getTokenFromCookie(itCookie->second);
        }
    }

    if (!token.has_value()) {
        return std::nullopt;
    }

    return verifyJwt(*token, jwtSecret);
}

// Пишет 401/403 в res и возвращает false, если доступа нет
static bool authorize(const httplib::Request& req, httplib::Response& res,
                      const std::string& jwtSecret, bool adminOnly) {
    std::optional<JwtPayload> user = getUserFromRequest(req, jwtSecret);
    if (!user) {
        sendError(res, "unauthorized", "Требуется действительный токен");
        return false;
    }
    if (adminOnly && user->role != "admin") {
        logWarning("Отказано в доступе userId=" + std::to_string(user->userId) + " role=" + user->role);
        sendError(res, "forbidden", "Операция доступна только администратору");
        return false;
    }
    return true;
}

// --------- разбор параметров ---------

static int intParam(const httplib::Request& req, const char* name) {
    if (!req.has_param(name)) {
        throw std::invalid_argument(std::string("Не задан параметр ") + name);
    }
    std::string raw = req.get_param_value(name);
    try {
        size_t used = 0;
        int value = std::stoi(raw, &used);
        if (used != raw.size()) throw std::invalid_argument(raw);
        return value;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Параметр ") + name + " должен быть целым: " + raw);
    }
}

static std::optional<int> optionalIntParam(const httplib::Request& req, const char* name) {
    if (!req.has_param(name)) return std::nullopt;
    return intParam(req, name);
}

static SessionType sessionParam(const httplib::Request& req) {
    if (!req.has_param("sessionType")) {
        throw std::invalid_argument("Не задан параметр sessionType");
    }
    return sessionTypeFromString(req.get_param_value("sessionType"));
}

static ScheduleRequest requestFromJson(const json& body) {
    if (!body.is_object()) {
        throw std::invalid_argument("Тело запроса должно быть JSON-объектом");
    }
    ScheduleRequest r;
    r.academicYearId = body.at("academicYearId").get<int>();
    r.sessionType    = sessionTypeFromString(body.at("sessionType").get<std::string>());
    r.classId        = body.at("classId").get<int>();
    r.name           = body.value("name", std::string(""));
    if (body.contains("section") && !body["section"].is_null()) {
        r.section = body["section"].get<std::string>();
    }
    return r;
}

int main() {
    try {
        AppConfig appCfg = AppConfig::fromEnv();
        configureLogger(appCfg.logFile, appCfg.logLevel);

        logInfo("=== Запуск HTTPS сервера расписаний на " + appCfg.bindHost + ":" +
                std::to_string(appCfg.port) + " ===");

        db::DbConfig dbCfg = db::DbConfig::fromEnv();
        db::ConnectionFactory dbFactory{dbCfg};
        db::PgScheduleStore store{dbFactory};
        TimetableService service{store, std::chrono::seconds(appCfg.previewTtlSeconds)};

        logInfo("Успешно инициализирована конфигурация БД");

        const std::string jwtSecret = appCfg.jwtSecret;

        httplib::SSLServer svr(appCfg.tlsCertPath.c_str(), appCfg.tlsKeyPath.c_str());

        if (!svr.is_valid()) {
            logError("SSLServer невалиден. Проверь " + appCfg.tlsCertPath + " и " + appCfg.tlsKeyPath);
            return 1;
        }

        // --- preflight для всех маршрутов API ---
        svr.Options(R"(/api/.*)", [](const httplib::Request&, httplib::Response& res) {
            setCors(res);
            res.status = 204;
        });

        // --- проверка выполнимости ---
        svr.Get("/api/timetable/feasibility", [&](const httplib::Request& req, httplib::Response& res) {
            runRoute("GET /api/timetable/feasibility", res, [&]() {
                if (!authorize(req, res, jwtSecret, false)) return;

                int classId = intParam(req, "classId");
                SessionType session = sessionParam(req);
                int yearId = intParam(req, "academicYearId");

                FeasibilityReport report = service.validateFeasibility(classId, session, yearId);
                sendOk(res, feasibilityReportToJson(report));
            });
        });

        // --- превью ---
        svr.Post("/api/timetable/preview", [&](const httplib::Request& req, httplib::Response& res) {
            runRoute("POST /api/timetable/preview", res, [&]() {
                if (!authorize(req, res, jwtSecret, true)) return;

                ScheduleRequest request = requestFromJson(json::parse(req.body));
                logInfo("POST /api/timetable/preview classId=" + std::to_string(request.classId) +
                        " year=" + std::to_string(request.academicYearId) +
                        " session=" + sessionTypeToString(request.sessionType));

                Preview preview = service.generatePreview(request);
                sendOk(res, previewToJson(preview), 201);
            });
        });

        svr.Delete(R"(/api/timetable/preview/([A-Za-z0-9_\-]+))", [&](const httplib::Request& req, httplib::Response& res) {
            runRoute("DELETE /api/timetable/preview", res, [&]() {
                if (!authorize(req, res, jwtSecret, true)) return;

                std::string token = req.matches[1];
                if (!service.discardPreview(token)) {
                    throw NotFoundError("Превью не найдено");
                }
                sendOk(res, json{{"discarded", true}});
            });
        });

        // --- публикация ---
        svr.Post("/api/timetable/publish", [&](const httplib::Request& req, httplib::Response& res) {
            runRoute("POST /api/timetable/publish", res, [&]() {
                if (!authorize(req, res, jwtSecret, true)) return;

                json body = json::parse(req.body);
                if (!body.is_object()) {
                    throw std::invalid_argument("Тело запроса должно быть JSON-объектом");
                }

                PublishResult result;
                if (body.contains("previewToken")) {
                    std::optional<std::string> nameOverride;
                    if (body.contains("name") && body["name"].is_string()) {
                        nameOverride = body["name"].get<std::string>();
                    }
                    result = service.publish(body["previewToken"].get<std::string>(), nameOverride);
                } else if (body.value("regenerate", false)) {
                    result = service.publishRegenerated(requestFromJson(body));
                } else {
                    throw std::invalid_argument("Нужен previewToken или regenerate=true с параметрами класса");
                }

                sendOk(res, publishResultToJson(result), 201);
            });
        });

        // --- удаление опубликованного расписания секции ---
        svr.Delete("/api/timetable/schedule", [&](const httplib::Request& req, httplib::Response& res) {
            runRoute("DELETE /api/timetable/schedule", res, [&]() {
                if (!authorize(req, res, jwtSecret, true)) return;

                ScheduleKey key;
                key.academicYearId = intParam(req, "academicYearId");
                key.sessionType    = sessionParam(req);
                key.classId        = intParam(req, "classId");
                if (!req.has_param("section") || req.get_param_value("section").empty()) {
                    throw std::invalid_argument("Не задан параметр section");
                }
                key.section = req.get_param_value("section");

                DeleteResult result = service.deleteClassSchedule(key);
                sendOk(res, deleteResultToJson(result));
            });
        });

        // --- недельный вид опубликованных сеток ---
        svr.Get("/api/timetable/weekly-view", [&](const httplib::Request& req, httplib::Response& res) {
            runRoute("GET /api/timetable/weekly-view", res, [&]() {
                if (!authorize(req, res, jwtSecret, false)) return;

                int yearId = intParam(req, "academicYearId");
                SessionType session = sessionParam(req);
                std::optional<int> classId   = optionalIntParam(req, "classId");
                std::optional<int> teacherId = optionalIntParam(req, "teacherId");

                sendOk(res, weeklyViewToJson(service.getWeeklyView(yearId, session, classId, teacherId)));
            });
        });

        // --- конфликты ---
        svr.Get("/api/timetable/conflicts", [&](const httplib::Request& req, httplib::Response& res) {
            runRoute("GET /api/timetable/conflicts", res, [&]() {
                if (!authorize(req, res, jwtSecret, false)) return;

                int classId = intParam(req, "classId");
                std::optional<int> yearId = optionalIntParam(req, "academicYearId");
                std::optional<SessionType> session;
                if (req.has_param("sessionType")) session = sessionParam(req);

                std::vector<ConflictDetail> conflicts = service.resolveConflicts(classId, yearId, session);
                sendOk(res, conflictsToJson(conflicts));
            });
        });

        // --- доступность учителя ---
        svr.Get(R"(/api/teachers/(\d+)/availability)", [&](const httplib::Request& req, httplib::Response& res) {
            runRoute("GET /api/teachers/availability", res, [&]() {
                if (!authorize(req, res, jwtSecret, false)) return;

                int teacherId = std::stoi(std::string(req.matches[1]));
                sendOk(res, availabilityViewToJson(service.getTeacherAvailability(teacherId)));
            });
        });

        // --- здоровье БД ---
        svr.Get("/api/health/db", [&](const httplib::Request&, httplib::Response& res) {
            runRoute("GET /api/health/db", res, [&]() {
                if (db::checkConnection(dbFactory)) {
                    sendOk(res, json{{"db", "up"}});
                } else {
                    sendError(res, "internal_error", "База данных недоступна", json{{"db", "down"}});
                }
            });
        });

        bool ok = svr.listen(appCfg.bindHost.c_str(), appCfg.port);
        if (!ok) {
            logError("Не удалось запустить HTTPS сервер на порту " + std::to_string(appCfg.port));
            return 1;
        }

    } catch (const std::exception& ex) {
        logError(std::string("Fatal error on startup: ") + ex.what());
        return 1;
    }

    return 0;
}
