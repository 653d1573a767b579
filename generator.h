#pragma once

#include <vector>

#include "model.h"
#include "requirements.h"

// Раскладывает недельные часы предметов по сетке 5x6 для каждой секции класса.
// Доступность учителей копируется, исходные сетки в input не меняются.
// Если очередное занятие некуда поставить, бросает GenerationError и
// ничего из уже разложенного не возвращает.
std::vector<ScheduleGrid> generateClassSchedule(
    const GenerationInput& input,
    const RequirementSet& requirements
);
