#include "availability.h"
#include "errors.h"

#include <stdexcept>

using nlohmann::json;

std::string slotStateToString(SlotState state) {
    switch (state) {
        case SlotState::Unavailable: return "unavailable";
        case SlotState::Free:        return "free";
        case SlotState::Assigned:    return "assigned";
    }
    return "unknown";
}

static SlotState slotStateFromString(const std::string& s) {
    if (s == "free")        return SlotState::Free;
    if (s == "assigned")    return SlotState::Assigned;
    if (s == "unavailable") return SlotState::Unavailable;
    throw MalformedAvailabilityError("Неизвестный статус слота: '" + s + "'");
}

static void checkSlot(int day, int period) {
    if (!isValidSlot(day, period)) {
        throw std::out_of_range("Слот вне сетки: day=" + std::to_string(day) +
                                ", period=" + std::to_string(period));
    }
}

// ==================== AvailabilityGrid ====================

AvailabilityGrid::AvailabilityGrid() {
    slots_.fill(SlotState::Unavailable);
}

AvailabilityGrid AvailabilityGrid::allFree() {
    AvailabilityGrid g;
    g.slots_.fill(SlotState::Free);
    return g;
}

SlotState AvailabilityGrid::state(int day, int period) const {
    checkSlot(day, period);
    return slots_[slotIndex(day, period)];
}

bool AvailabilityGrid::isFree(int day, int period) const {
    return state(day, period) == SlotState::Free;
}

void AvailabilityGrid::setState(int day, int period, SlotState state) {
    checkSlot(day, period);
    slots_[slotIndex(day, period)] = state;
}

void AvailabilityGrid::markAssigned(int day, int period) {
    checkSlot(day, period);
    SlotState& s = slots_[slotIndex(day, period)];
    if (s != SlotState::Free) {
        throw std::logic_error("Слот " + dayName(day) + "/" + std::to_string(period) +
                               " не свободен (" + slotStateToString(s) + ")");
    }
    s = SlotState::Assigned;
}

bool AvailabilityGrid::releaseAssigned(int day, int period) {
    checkSlot(day, period);
    SlotState& s = slots_[slotIndex(day, period)];
    // вручную закрытые слоты не трогаем
    if (s != SlotState::Assigned) return false;
    s = SlotState::Free;
    return true;
}

int AvailabilityGrid::countFree() const {
    return countInState(SlotState::Free);
}

int AvailabilityGrid::countInState(SlotState state) const {
    int n = 0;
    for (SlotState s : slots_) {
        if (s == state) ++n;
    }
    return n;
}

std::vector<int> AvailabilityGrid::freeSlots() const {
    std::vector<int> out;
    for (int i = 0; i < kSlotsPerWeek; ++i) {
        if (slots_[i] == SlotState::Free) out.push_back(i);
    }
    return out;
}

// ==================== JSON ====================

AvailabilityGrid parseAvailabilityJson(const json& j) {
    if (j.is_null()) {
        return AvailabilityGrid{};
    }

    if (j.is_object()) {
        // старый формат {"sunday": [1,2,...], ...}
        throw MalformedAvailabilityError("Сетка доступности в формате словаря по дням не поддерживается");
    }
    if (!j.is_array()) {
        throw MalformedAvailabilityError("Сетка доступности должна быть массивом");
    }
    if (j.empty()) {
        return AvailabilityGrid{};
    }
    if (j.size() != static_cast<size_t>(kSlotsPerWeek)) {
        throw MalformedAvailabilityError("Сетка доступности должна содержать ровно " +
                                         std::to_string(kSlotsPerWeek) + " ячеек, получено " +
                                         std::to_string(j.size()));
    }

    AvailabilityGrid grid;
    std::array<bool, kSlotsPerWeek> seen{};

    for (const json& cell : j) {
        if (cell.is_array()) {
            throw MalformedAvailabilityError("Двумерный (устаревший) формат сетки доступности отклонён");
        }
        if (!cell.is_object() ||
            !cell.contains("day") || !cell["day"].is_number_integer() ||
            !cell.contains("period") || !cell["period"].is_number_integer()) {
            throw MalformedAvailabilityError("Ячейка доступности без целых day/period");
        }

        int day    = cell["day"].get<int>();
        int period = cell["period"].get<int>();
        if (!isValidSlot(day, period)) {
            throw MalformedAvailabilityError("Ячейка вне сетки: day=" + std::to_string(day) +
                                             ", period=" + std::to_string(period));
        }

        int idx = slotIndex(day, period);
        if (seen[idx]) {
            throw MalformedAvailabilityError("Повтор ячейки day=" + std::to_string(day) +
                                             ", period=" + std::to_string(period));
        }
        seen[idx] = true;

        SlotState state;
        if (cell.contains("status") && cell["status"].is_string()) {
            state = slotStateFromString(cell["status"].get<std::string>());
            if (cell.contains("is_free") && cell["is_free"].is_boolean() &&
                cell["is_free"].get<bool>() != (state == SlotState::Free)) {
                throw MalformedAvailabilityError("is_free противоречит status в ячейке day=" +
                                                 std::to_string(day) + ", period=" +
                                                 std::to_string(period));
            }
        } else if (cell.contains("is_free") && cell["is_free"].is_boolean()) {
            state = cell["is_free"].get<bool>() ? SlotState::Free : SlotState::Unavailable;
        } else {
            throw MalformedAvailabilityError("Ячейка без status/is_free");
        }

        grid.setState(day, period, state);
    }

    return grid;
}

AvailabilityGrid parseAvailabilityText(const std::string& text) {
    if (text.empty()) {
        return AvailabilityGrid{};
    }
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& ex) {
        throw MalformedAvailabilityError(std::string("Сетка доступности не является JSON: ") + ex.what());
    }
    return parseAvailabilityJson(j);
}

json availabilityToJson(const AvailabilityGrid& grid) {
    json arr = json::array();
    for (int day = 0; day < kDaysPerWeek; ++day) {
        for (int period = 0; period < kPeriodsPerDay; ++period) {
            SlotState s = grid.state(day, period);
            arr.push_back({
                {"day", day},
                {"period", period},
                {"status", slotStateToString(s)},
                {"is_free", s == SlotState::Free}
            });
        }
    }
    return arr;
}

// ==================== WorkingAvailability ====================

WorkingAvailability::WorkingAvailability(const std::vector<TeacherAvailability>& teachers) {
    for (const TeacherAvailability& t : teachers) {
        if (indexOf(t.teacherId) >= 0) continue;
        std::array<bool, kSlotsPerWeek> cells{};
        for (int i = 0; i < kSlotsPerWeek; ++i) {
            cells[i] = t.grid.isFree(slotDay(i), slotPeriod(i));
        }
        teacherIds.push_back(t.teacherId);
        free.push_back(cells);
    }
}

int WorkingAvailability::indexOf(int teacherId) const {
    for (int i = 0; i < (int)teacherIds.size(); ++i) {
        if (teacherIds[i] == teacherId) return i;
    }
    return -1;
}

bool WorkingAvailability::hasTeacher(int teacherId) const {
    return indexOf(teacherId) >= 0;
}

bool WorkingAvailability::isFree(int teacherId, int day, int period) const {
    int i = indexOf(teacherId);
    if (i < 0 || !isValidSlot(day, period)) return false;
    return free[i][slotIndex(day, period)];
}

void WorkingAvailability::consume(int teacherId, int day, int period) {
    int i = indexOf(teacherId);
    if (i < 0 || !isValidSlot(day, period) || !free[i][slotIndex(day, period)]) {
        throw std::logic_error("Попытка занять несвободный слот учителя id=" + std::to_string(teacherId));
    }
    free[i][slotIndex(day, period)] = false;
}

void WorkingAvailability::release(int teacherId, int day, int period) {
    int i = indexOf(teacherId);
    if (i < 0 || !isValidSlot(day, period)) return;
    free[i][slotIndex(day, period)] = true;
}

int WorkingAvailability::countFree(int teacherId) const {
    int i = indexOf(teacherId);
    if (i < 0) return 0;
    int n = 0;
    for (bool f : free[i]) if (f) ++n;
    return n;
}
