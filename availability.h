#pragma once

#include <array>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model.h"

enum class SlotState {
    Unavailable, // учитель не объявил время свободным
    Free,
    Assigned     // занято опубликованным расписанием
};

std::string slotStateToString(SlotState state);

// Недельная сетка свободного времени учителя: 30 ячеек, индекс day*6+period
class AvailabilityGrid {
public:
    AvailabilityGrid(); // всё Unavailable

    static AvailabilityGrid allFree();

    SlotState state(int day, int period) const;
    bool isFree(int day, int period) const;
    void setState(int day, int period, SlotState state);

    // Free -> Assigned; std::logic_error, если ячейка не свободна
    void markAssigned(int day, int period);

    // Assigned -> Free; false, если ячейка не была занята расписанием
    bool releaseAssigned(int day, int period);

    int countFree() const;
    int countInState(SlotState state) const;
    std::vector<int> freeSlots() const;

    bool operator==(const AvailabilityGrid& other) const { return slots_ == other.slots_; }
    bool operator!=(const AvailabilityGrid& other) const { return !(*this == other); }

private:
    std::array<SlotState, kSlotsPerWeek> slots_;
};

struct TeacherAvailability {
    int teacherId;
    std::string teacherName;
    AvailabilityGrid grid;
};

// Разбор JSON из БД/конфига. Принимает только массив ровно из 30 объектов
// {day, period, status, is_free}; null => сетка не объявлена (всё Unavailable).
// Любая другая форма => MalformedAvailabilityError.
AvailabilityGrid parseAvailabilityJson(const nlohmann::json& j);
AvailabilityGrid parseAvailabilityText(const std::string& text);

nlohmann::json availabilityToJson(const AvailabilityGrid& grid);

// Рабочая копия доступности на время одной генерации.
// Генератор читает и «расходует» только её, исходные сетки не трогаются.
class WorkingAvailability {
public:
    explicit WorkingAvailability(const std::vector<TeacherAvailability>& teachers);

    bool hasTeacher(int teacherId) const;
    bool isFree(int teacherId, int day, int period) const;
    void consume(int teacherId, int day, int period);
    void release(int teacherId, int day, int period);
    int countFree(int teacherId) const;

private:
    std::vector<int> teacherIds;
    std::vector<std::array<bool, kSlotsPerWeek>> free;

    int indexOf(int teacherId) const;
};
