#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "api_json.h"
#include "errors.h"
#include "logger.h"
#include "memory_store.h"
#include "model.h"
#include "service.h"

using nlohmann::json;

// Офлайн-прогон движка по каталогу из JSON-файла, ответ печатается
// в том же конверте, что и у HTTPS API.

static void printUsage(const char* prog) {
    std::cerr
        << "Usage:\n"
        << "  " << prog << " <catalog.json> feasibility <classId> <morning|evening> <academicYearId>\n"
        << "  " << prog << " <catalog.json> preview <classId> <morning|evening> <academicYearId> [--publish] [--name NAME] [--section S]\n"
        << "  " << prog << " <catalog.json> weekly <academicYearId> <morning|evening> [--class ID] [--teacher ID]\n"
        << "  " << prog << " <catalog.json> conflicts <classId> [academicYearId] [morning|evening]\n"
        << "  " << prog << " <catalog.json> availability <teacherId>\n";
}

static int toInt(const std::string& s, const char* what) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(s, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(what) + " должен быть целым: " + s);
    }
    if (used != s.size()) {
        throw std::invalid_argument(std::string(what) + " должен быть целым: " + s);
    }
    return v;
}

static json loadCatalog(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::invalid_argument("Не удалось открыть файл каталога: " + path);
    }
    return json::parse(in);
}

static json runCommand(TimetableService& service, const std::vector<std::string>& args) {
    const std::string& cmd = args[0];

    if (cmd == "feasibility" && args.size() == 4) {
        FeasibilityReport report = service.validateFeasibility(
            toInt(args[1], "classId"), sessionTypeFromString(args[2]), toInt(args[3], "academicYearId"));
        return feasibilityReportToJson(report);
    }

    if (cmd == "preview" && args.size() >= 4) {
        ScheduleRequest request;
        request.classId        = toInt(args[1], "classId");
        request.sessionType    = sessionTypeFromString(args[2]);
        request.academicYearId = toInt(args[3], "academicYearId");

        bool doPublish = false;
        for (size_t i = 4; i < args.size(); ++i) {
            if (args[i] == "--publish") {
                doPublish = true;
            } else if (args[i] == "--name" && i + 1 < args.size()) {
                request.name = args[++i];
            } else if (args[i] == "--section" && i + 1 < args.size()) {
                request.section = args[++i];
            } else {
                throw std::invalid_argument("Неизвестный аргумент: " + args[i]);
            }
        }

        Preview preview = service.generatePreview(request);
        json data = previewToJson(preview);
        if (doPublish) {
            data["published"] = publishResultToJson(service.publish(preview.token));
        }
        return data;
    }

    if (cmd == "weekly" && args.size() >= 3) {
        std::optional<int> classId;
        std::optional<int> teacherId;
        for (size_t i = 3; i < args.size(); ++i) {
            if (args[i] == "--class" && i + 1 < args.size()) {
                classId = toInt(args[++i], "classId");
            } else if (args[i] == "--teacher" && i + 1 < args.size()) {
                teacherId = toInt(args[++i], "teacherId");
            } else {
                throw std::invalid_argument("Неизвестный аргумент: " + args[i]);
            }
        }
        return weeklyViewToJson(service.getWeeklyView(
            toInt(args[1], "academicYearId"), sessionTypeFromString(args[2]), classId, teacherId));
    }

    if (cmd == "conflicts" && args.size() >= 2 && args.size() <= 4) {
        std::optional<int> yearId;
        std::optional<SessionType> session;
        if (args.size() >= 3) yearId = toInt(args[2], "academicYearId");
        if (args.size() == 4) session = sessionTypeFromString(args[3]);
        return conflictsToJson(service.resolveConflicts(toInt(args[1], "classId"), yearId, session));
    }

    if (cmd == "availability" && args.size() == 2) {
        return availabilityViewToJson(service.getTeacherAvailability(toInt(args[1], "teacherId")));
    }

    throw std::invalid_argument("Неизвестная команда или неверное число аргументов: " + cmd);
}

int main(int argc, char** argv) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    const char* logFile  = std::getenv("TIMETABLE_LOG_FILE");
    const char* logLevel = std::getenv("TIMETABLE_LOG_LEVEL");
    configureLogger(logFile ? logFile : "timetable.log",
                    logLevelFromString(logLevel ? logLevel : "info"));

    std::vector<std::string> args(argv + 2, argv + argc);
    json envelope;
    bool ok = false;

    try {
        std::unique_ptr<MemoryScheduleStore> store = MemoryScheduleStore::fromJson(loadCatalog(argv[1]));
        TimetableService service{*store};

        envelope = makeOkEnvelope(runCommand(service, args));
        ok = true;
    } catch (const TimetableError& ex) {
        envelope = errorToEnvelope(ex);
    } catch (const json::exception& ex) {
        envelope = makeErrorEnvelope("bad_request", std::string("Некорректный JSON: ") + ex.what());
    } catch (const std::invalid_argument& ex) {
        envelope = makeErrorEnvelope("bad_request", ex.what());
        printUsage(argv[0]);
    } catch (const std::exception& ex) {
        logError(std::string("timetable_cli: ") + ex.what());
        envelope = makeErrorEnvelope("internal_error", ex.what());
    }

    std::cout << envelope.dump(2) << std::endl;
    return ok ? 0 : 2;
}
