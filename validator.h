#include "model.h"
#include "requirements.h"

#pragma once

struct IntegrityResult {
    bool ok;                             // true, если нарушений нет
    std::vector<IntegrityIssue> issues;  // каждая проблемная ячейка отдельно
};

// Последний рубеж перед показом превью: проверяет всю партию сеток класса,
// даже если генератор уже гарантирует эти свойства.
class GridIntegrityValidator {
    public:
        IntegrityResult checkAll(
            const GenerationInput& input,
            const RequirementSet& requirements,
            const std::vector<ScheduleGrid>& grids
        );

        // checkAll + IntegrityViolation при любой проблеме
        void enforce(
            const GenerationInput& input,
            const RequirementSet& requirements,
            const std::vector<ScheduleGrid>& grids
        );

    private:
        void checkAllCellsFilled(
            const std::vector<ScheduleGrid>& grids,
            IntegrityResult& result
        );

        void checkTeacherConflicts(
            const GenerationInput& input,
            const std::vector<ScheduleGrid>& grids,
            IntegrityResult& result
        );

        void checkCellsMatchRequirements(
            const GenerationInput& input,
            const RequirementSet& requirements,
            const std::vector<ScheduleGrid>& grids,
            IntegrityResult& result
        );

        void checkDeclaredAvailability(
            const GenerationInput& input,
            const std::vector<ScheduleGrid>& grids,
            IntegrityResult& result
        );

        void addIssue(
            IntegrityResult& result,
            const std::string& kind,
            const ScheduleCell& cell,
            const std::string& message
        );
};
