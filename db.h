#pragma once

#include <pqxx/pqxx>

#include <memory>
#include <string>
#include <optional>
#include <vector>

#include "model.h"
#include "store.h"

namespace db {

// --- Конфиг подключения к БД ---
struct DbConfig {
    std::string host;
    int         port;
    std::string dbname;
    std::string user;
    std::string password;

    static DbConfig fromEnv();
};

// --- Фабрика соединений ---
class ConnectionFactory {
public:
    explicit ConnectionFactory(const DbConfig& cfg);

    std::unique_ptr<pqxx::connection> createConnection() const;

private:
    DbConfig config;
};

// SELECT 1; для /api/health/db
bool checkConnection(const ConnectionFactory& factory);

// --- Хранилище расписаний в PostgreSQL (схема в schema.sql) ---
// Каждое чтение открывает своё соединение; транзакция держит соединение до commit().
class PgScheduleStore : public ScheduleStore {
public:
    explicit PgScheduleStore(ConnectionFactory& factory)
        : factory_(factory) {}

    GenerationInput loadGenerationInput(int academicYearId, SessionType sessionType, int classId) override;

    std::vector<PublishedCell> loadPublishedCells(
        const std::optional<int>& academicYearId,
        const std::optional<SessionType>& sessionType
    ) override;

    std::vector<Constraint> loadConstraints(int academicYearId, SessionType sessionType) override;

    std::vector<TeacherAvailability> loadTeachers(const std::vector<int>& teacherIds) override;

    std::vector<Subject> loadSubjects(const std::vector<int>& subjectIds) override;

    std::unique_ptr<StoreTransaction> begin() override;

private:
    ConnectionFactory& factory_;
};

} // namespace db
