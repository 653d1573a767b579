#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "store.h"

// Хранилище в памяти: для CLI (каталог из JSON-файла) и тестов.
// Транзакция держит мьютекс хранилища всё время жизни и работает с копией
// состояния; commit() подменяет состояние целиком.
class MemoryScheduleStore : public ScheduleStore {
public:
    struct StoredClass {
        SchoolClass schoolClass;
        int academicYearId;
        SessionType sessionType;
    };

    // academicYearId / sessionType пустые => действует во всех годах / сменах
    struct StoredConstraint {
        Constraint constraint;
        std::optional<int> academicYearId;
        std::optional<SessionType> sessionType;
    };

    struct State {
        std::vector<StoredClass> classes;
        std::vector<Subject> subjects;
        std::vector<TeacherAvailability> teachers;
        std::vector<TeacherAssignment> assignments;
        std::vector<StoredConstraint> constraints;
        std::vector<PublishedCell> published;
    };

    MemoryScheduleStore() = default;

    // Каталог из JSON: classes, subjects, teachers, assignments, constraints, published
    static std::unique_ptr<MemoryScheduleStore> fromJson(const nlohmann::json& catalog);

    void addClass(const SchoolClass& schoolClass, int academicYearId, SessionType sessionType);
    void addSubject(const Subject& subject);
    void addTeacher(const TeacherAvailability& teacher);
    void addAssignment(const TeacherAssignment& assignment);
    void addConstraint(const Constraint& constraint,
                       const std::optional<int>& academicYearId = std::nullopt,
                       const std::optional<SessionType>& sessionType = std::nullopt);
    void addPublishedCell(const PublishedCell& cell);
    void setTeacherAvailability(int teacherId, const AvailabilityGrid& grid);

    AvailabilityGrid teacherAvailability(int teacherId) const; // NotFoundError
    std::vector<PublishedCell> publishedCells() const;

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
    friend class MemoryTransaction;

    mutable std::mutex mutex_;
    State state_;
};
