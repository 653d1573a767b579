#include "db.h"

#include <algorithm>
#include <optional>
#include <vector>
#include <string>
#include <cstdlib>
#include <stdexcept>
#include <sstream>
#include <memory>

#include <pqxx/pqxx>

#include "errors.h"
#include "logger.h"

namespace db {

// ==================== DbConfig::fromEnv ====================

static std::string getEnvOrThrow(const char* name) {
    const char* val = std::getenv(name);
    if (!val) {
        std::string msg = "Environment variable ";
        msg += name;
        msg += " is not set";
        throw std::runtime_error(msg);
    }
    return std::string(val);
}

DbConfig DbConfig::fromEnv() {
    DbConfig cfg;
    cfg.host     = getEnvOrThrow("TIMETABLE_DB_HOST");
    cfg.dbname   = getEnvOrThrow("TIMETABLE_DB_NAME");
    cfg.user     = getEnvOrThrow("TIMETABLE_DB_USER");
    cfg.password = getEnvOrThrow("TIMETABLE_DB_PASSWORD");

    const char* portStr = std::getenv("TIMETABLE_DB_PORT");
    cfg.port = portStr ? std::stoi(portStr) : 5432; // по умолчанию 5432

    return cfg;
}

// ==================== ConnectionFactory ====================

ConnectionFactory::ConnectionFactory(const DbConfig& cfg)
    : config(cfg) {}

std::unique_ptr<pqxx::connection> ConnectionFactory::createConnection() const {
    std::stringstream ss;
    ss << "host=" << config.host
       << " port=" << config.port
       << " dbname=" << config.dbname
       << " user=" << config.user
       << " password=" << config.password;

    return std::make_unique<pqxx::connection>(ss.str());
}

bool checkConnection(const ConnectionFactory& factory) {
    try {
        auto conn = factory.createConnection();
        pqxx::work tx{*conn};
        tx.exec1("SELECT 1");
        tx.commit();
        return true;
    } catch (const std::exception& ex) {
        logError(std::string("Проверка БД не прошла: ") + ex.what());
        return false;
    }
}

// ==================== разбор строк ====================

static std::optional<int> optionalIntField(const pqxx::row& r, const char* column) {
    if (r[column].is_null()) return std::nullopt;
    return r[column].as<int>();
}

static TeacherAvailability teacherFromRow(const pqxx::row& r) {
    TeacherAvailability t;
    t.teacherId   = r["id"].as<int>();
    t.teacherName = r["name"].as<std::string>();
    if (r["free_time_slots"].is_null()) {
        t.grid = AvailabilityGrid{};
    } else {
        t.grid = parseAvailabilityText(r["free_time_slots"].as<std::string>());
    }
    return t;
}

static ScheduleCell cellFromRow(const pqxx::row& r) {
    ScheduleCell c;
    c.classId   = r["class_id"].as<int>();
    c.section   = r["section"].as<std::string>();
    c.day       = r["day"].as<int>();
    c.period    = r["period"].as<int>();
    c.subjectId = r["subject_id"].as<int>();
    c.teacherId = r["teacher_id"].as<int>();
    return c;
}

static Constraint constraintFromRow(const pqxx::row& r) {
    Constraint c;
    std::string type = r["type"].as<std::string>();
    c.id          = r["id"].as<int>();
    c.type        = constraintTypeFromString(type);
    c.teacherId   = optionalIntField(r, "teacher_id");
    c.subjectId   = optionalIntField(r, "subject_id");
    c.classId     = optionalIntField(r, "class_id");
    c.day         = optionalIntField(r, "day");
    c.period      = optionalIntField(r, "period");
    c.limit       = r["limit_value"].is_null() ? (type == "no_consecutive" ? 1 : 0)
                                               : r["limit_value"].as<int>();
    c.priority    = r["priority"].as<int>(1);
    c.description = r["description"].as<std::string>("");
    return c;
}

static const char* kTeacherColumns =
    "SELECT id, name, free_time_slots::text AS free_time_slots FROM teacher ";

static std::vector<TeacherAvailability> selectTeachers(
    pqxx::work& tx,
    std::vector<int> teacherIds,
    bool forUpdate
) {
    // одинаковый порядок блокировок во всех транзакциях
    std::sort(teacherIds.begin(), teacherIds.end());
    teacherIds.erase(std::unique(teacherIds.begin(), teacherIds.end()), teacherIds.end());

    std::string sql = std::string(kTeacherColumns) + "WHERE id = $1" + (forUpdate ? " FOR UPDATE" : "");

    std::vector<TeacherAvailability> result;
    for (int id : teacherIds) {
        pqxx::result rows = tx.exec_params(sql, id);
        if (rows.empty()) continue;
        result.push_back(teacherFromRow(rows[0]));
    }
    return result;
}

static std::vector<Constraint> selectConstraints(pqxx::work& tx, int academicYearId, SessionType sessionType) {
    const char* sql = R"SQL(
        SELECT id, type, teacher_id, subject_id, class_id, day, period,
               limit_value, priority, COALESCE(description, '') AS description
        FROM schedule_constraint
        WHERE (academic_year_id IS NULL OR academic_year_id = $1)
          AND (session_type IS NULL OR session_type = $2)
        ORDER BY id;
    )SQL";

    std::vector<Constraint> result;
    pqxx::result rows = tx.exec_params(sql, academicYearId, sessionTypeToString(sessionType));
    for (const auto& r : rows) {
        result.push_back(constraintFromRow(r));
    }
    return result;
}

// ==================== PgTransaction ====================

class PgTransaction : public StoreTransaction {
public:
    explicit PgTransaction(std::unique_ptr<pqxx::connection> conn)
        : conn_(std::move(conn)), tx_(*conn_) {}

    // pqxx::work без commit() откатывается в деструкторе

    std::vector<TeacherAvailability> lockTeachers(const std::vector<int>& teacherIds) override {
        return selectTeachers(tx_, teacherIds, true);
    }

    bool isPublished(const ScheduleKey& key) override {
        pqxx::row r = tx_.exec_params1(
            R"SQL(
                SELECT COUNT(*) AS n FROM schedule_cell
                WHERE academic_year_id = $1 AND session_type = $2
                  AND class_id = $3 AND section = $4
            )SQL",
            key.academicYearId,
            sessionTypeToString(key.sessionType),
            key.classId,
            key.section
        );
        return r["n"].as<long>() > 0;
    }

    bool isNameTaken(int academicYearId, SessionType sessionType,
                     int classId, const std::string& name) override {
        pqxx::row r = tx_.exec_params1(
            R"SQL(
                SELECT COUNT(*) AS n FROM schedule_cell
                WHERE academic_year_id = $1 AND session_type = $2
                  AND class_id <> $3 AND name = $4
            )SQL",
            academicYearId,
            sessionTypeToString(sessionType),
            classId,
            name
        );
        return r["n"].as<long>() > 0;
    }

    std::vector<ScheduleCell> findCells(const ScheduleKey& key) override {
        pqxx::result rows = tx_.exec_params(
            R"SQL(
                SELECT class_id, section, day, period, subject_id, teacher_id
                FROM schedule_cell
                WHERE academic_year_id = $1 AND session_type = $2
                  AND class_id = $3 AND section = $4
                ORDER BY day, period
                FOR UPDATE
            )SQL",
            key.academicYearId,
            sessionTypeToString(key.sessionType),
            key.classId,
            key.section
        );

        std::vector<ScheduleCell> result;
        for (const auto& r : rows) {
            result.push_back(cellFromRow(r));
        }
        return result;
    }

    void insertCell(int academicYearId, SessionType sessionType,
                    const ScheduleCell& cell, const std::string& name) override {
        try {
            tx_.exec_params(
                R"SQL(
                    INSERT INTO schedule_cell
                        (academic_year_id, session_type, class_id, section, day, period,
                         subject_id, teacher_id, name)
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9)
                )SQL",
                academicYearId,
                sessionTypeToString(sessionType),
                cell.classId,
                cell.section,
                cell.day,
                cell.period,
                cell.subjectId,
                cell.teacherId,
                name
            );
        } catch (const pqxx::unique_violation& ex) {
            logWarning(std::string("unique_violation в schedule_cell: ") + ex.what());
            throw NameConflictError("already_published",
                                    "Секция " + cell.section + " класса " + std::to_string(cell.classId) +
                                    " уже опубликована параллельным запросом");
        }
    }

    int deleteCells(const ScheduleKey& key) override {
        pqxx::result res = tx_.exec_params(
            R"SQL(
                DELETE FROM schedule_cell
                WHERE academic_year_id = $1 AND session_type = $2
                  AND class_id = $3 AND section = $4
            )SQL",
            key.academicYearId,
            sessionTypeToString(key.sessionType),
            key.classId,
            key.section
        );
        return static_cast<int>(res.affected_rows());
    }

    void saveAvailability(int teacherId, const AvailabilityGrid& grid) override {
        tx_.exec_params(
            "UPDATE teacher SET free_time_slots = $1::jsonb WHERE id = $2",
            availabilityToJson(grid).dump(),
            teacherId
        );
    }

    void commit() override {
        tx_.commit();
    }

private:
    std::unique_ptr<pqxx::connection> conn_;
    pqxx::work tx_;
};

// ==================== PgScheduleStore ====================

GenerationInput PgScheduleStore::loadGenerationInput(int academicYearId, SessionType sessionType, int classId) {
    auto conn = factory_.createConnection();
    pqxx::work tx{*conn};

    pqxx::result classRows = tx.exec_params(
        R"SQL(
            SELECT id, name, section_count FROM school_class
            WHERE id = $1 AND academic_year_id = $2 AND session_type = $3
        )SQL",
        classId,
        academicYearId,
        sessionTypeToString(sessionType)
    );
    if (classRows.empty()) {
        throw NotFoundError("Класс id=" + std::to_string(classId) + " не найден для года " +
                            std::to_string(academicYearId) + ", смена " + sessionTypeToString(sessionType));
    }

    GenerationInput input;
    input.academicYearId = academicYearId;
    input.sessionType    = sessionType;

    const auto& cr = classRows[0];
    input.schoolClass.id           = cr["id"].as<int>();
    input.schoolClass.name         = cr["name"].as<std::string>();
    input.schoolClass.sectionCount = cr["section_count"].as<int>();

    pqxx::result subjectRows = tx.exec_params(
        "SELECT id, class_id, name, weekly_hours FROM subject WHERE class_id = $1 ORDER BY id",
        classId
    );
    for (const auto& r : subjectRows) {
        Subject s;
        s.id          = r["id"].as<int>();
        s.classId     = r["class_id"].as<int>();
        s.name        = r["name"].as<std::string>();
        s.weeklyHours = r["weekly_hours"].as<int>();
        input.subjects.push_back(s);
    }

    pqxx::result assignmentRows = tx.exec_params(
        R"SQL(
            SELECT teacher_id, subject_id, class_id, section
            FROM teacher_assignment
            WHERE class_id = $1
            ORDER BY id
        )SQL",
        classId
    );
    std::vector<int> teacherIds;
    for (const auto& r : assignmentRows) {
        TeacherAssignment a;
        a.teacherId = r["teacher_id"].as<int>();
        a.subjectId = r["subject_id"].as<int>();
        a.classId   = r["class_id"].as<int>();
        if (!r["section"].is_null()) {
            a.section = r["section"].as<std::string>();
        }
        input.assignments.push_back(a);
        teacherIds.push_back(a.teacherId);
    }

    input.teachers    = selectTeachers(tx, teacherIds, false);
    input.constraints = selectConstraints(tx, academicYearId, sessionType);

    tx.commit();
    return input;
}

std::vector<PublishedCell> PgScheduleStore::loadPublishedCells(
    const std::optional<int>& academicYearId,
    const std::optional<SessionType>& sessionType
) {
    auto conn = factory_.createConnection();
    pqxx::work tx{*conn};

    std::optional<std::string> sessionStr;
    if (sessionType) sessionStr = sessionTypeToString(*sessionType);

    pqxx::result rows = tx.exec_params(
        R"SQL(
            SELECT academic_year_id, session_type, class_id, section, day, period,
                   subject_id, teacher_id, COALESCE(name, '') AS name
            FROM schedule_cell
            WHERE ($1::int IS NULL OR academic_year_id = $1::int)
              AND ($2::text IS NULL OR session_type = $2::text)
            ORDER BY academic_year_id, session_type, class_id, section, day, period
        )SQL",
        academicYearId,
        sessionStr
    );
    tx.commit();

    std::vector<PublishedCell> result;
    for (const auto& r : rows) {
        PublishedCell pc;
        pc.academicYearId = r["academic_year_id"].as<int>();
        pc.sessionType    = sessionTypeFromString(r["session_type"].as<std::string>());
        pc.cell           = cellFromRow(r);
        pc.name           = r["name"].as<std::string>();
        result.push_back(std::move(pc));
    }
    return result;
}

std::vector<Constraint> PgScheduleStore::loadConstraints(int academicYearId, SessionType sessionType) {
    auto conn = factory_.createConnection();
    pqxx::work tx{*conn};
    std::vector<Constraint> result = selectConstraints(tx, academicYearId, sessionType);
    tx.commit();
    return result;
}

std::vector<TeacherAvailability> PgScheduleStore::loadTeachers(const std::vector<int>& teacherIds) {
    auto conn = factory_.createConnection();
    pqxx::work tx{*conn};
    std::vector<TeacherAvailability> result = selectTeachers(tx, teacherIds, false);
    tx.commit();
    return result;
}

std::vector<Subject> PgScheduleStore::loadSubjects(const std::vector<int>& subjectIds) {
    std::vector<int> ids = subjectIds;
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    auto conn = factory_.createConnection();
    pqxx::work tx{*conn};

    std::vector<Subject> result;
    for (int id : ids) {
        pqxx::result rows = tx.exec_params(
            "SELECT id, class_id, name, weekly_hours FROM subject WHERE id = $1",
            id
        );
        if (rows.empty()) continue;
        Subject s;
        s.id          = rows[0]["id"].as<int>();
        s.classId     = rows[0]["class_id"].as<int>();
        s.name        = rows[0]["name"].as<std::string>();
        s.weeklyHours = rows[0]["weekly_hours"].as<int>();
        result.push_back(s);
    }
    tx.commit();
    return result;
}

std::unique_ptr<StoreTransaction> PgScheduleStore::begin() {
    return std::make_unique<PgTransaction>(factory_.createConnection());
}

} // namespace db
