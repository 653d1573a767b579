#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "availability.h"
#include "model.h"
#include "requirements.h"

// Опубликованная ячейка вместе с её годом/сменой и именем расписания
struct PublishedCell {
    int academicYearId;
    SessionType sessionType;
    ScheduleCell cell;
    std::string name;
};

// Единица работы над хранилищем. Без commit() деструктор откатывает всё.
class StoreTransaction {
public:
    virtual ~StoreTransaction() = default;

    // Блокирует строки учителей до конца транзакции; неизвестные id пропускаются
    virtual std::vector<TeacherAvailability> lockTeachers(const std::vector<int>& teacherIds) = 0;

    virtual bool isPublished(const ScheduleKey& key) = 0;

    // Имя занято опубликованным расписанием другого класса того же года/смены
    virtual bool isNameTaken(int academicYearId, SessionType sessionType,
                             int classId, const std::string& name) = 0;

    virtual std::vector<ScheduleCell> findCells(const ScheduleKey& key) = 0;

    virtual void insertCell(int academicYearId, SessionType sessionType,
                            const ScheduleCell& cell, const std::string& name) = 0;

    virtual int deleteCells(const ScheduleKey& key) = 0;

    virtual void saveAvailability(int teacherId, const AvailabilityGrid& grid) = 0;

    virtual void commit() = 0;
};

class ScheduleStore {
public:
    virtual ~ScheduleStore() = default;

    // Класс, его предметы, назначения, доступность учителей и ограничения.
    // NotFoundError, если класса нет в этом году/смене.
    virtual GenerationInput loadGenerationInput(int academicYearId, SessionType sessionType, int classId) = 0;

    virtual std::vector<PublishedCell> loadPublishedCells(
        const std::optional<int>& academicYearId,
        const std::optional<SessionType>& sessionType
    ) = 0;

    virtual std::vector<Constraint> loadConstraints(int academicYearId, SessionType sessionType) = 0;

    virtual std::vector<TeacherAvailability> loadTeachers(const std::vector<int>& teacherIds) = 0;

    // Неизвестные id пропускаются
    virtual std::vector<Subject> loadSubjects(const std::vector<int>& subjectIds) = 0;

    virtual std::unique_ptr<StoreTransaction> begin() = 0;
};
