#pragma once

#include <vector>

#include "availability.h"
#include "model.h"
#include "store.h"

// Разбор уже опубликованных данных класса: что нарушено и где.
// scopeCells: все опубликованные ячейки того же года и смены (нужны
// для поиска двойных бронирований учителя в других классах).
std::vector<ConflictDetail> findConflicts(
    int classId,
    int academicYearId,
    SessionType sessionType,
    const std::vector<PublishedCell>& scopeCells,
    const std::vector<Constraint>& constraints,
    const std::vector<TeacherAvailability>& teachers
);
