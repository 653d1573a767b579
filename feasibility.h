#pragma once

#include "model.h"
#include "requirements.h"

// Проверка до генерации: сравнивает требуемые часы с доступностью
// учителей и ограничениями. Все проверки выполняются всегда, чтобы
// администратор увидел полную картину, а не первую ошибку.
class FeasibilityValidator {
    public:
        FeasibilityReport checkAll(
            const GenerationInput& input,
            const RequirementSet& requirements
        );

    private:
        void checkWeeklyHours(
            const GenerationInput& input,
            FeasibilityReport& report
        );

        void checkTeacherCapacity(
            const GenerationInput& input,
            const RequirementSet& requirements,
            FeasibilityReport& report
        );

        void checkForbiddenConstraints(
            const GenerationInput& input,
            const RequirementSet& requirements,
            FeasibilityReport& report
        );

        void checkRequiredConstraints(
            const GenerationInput& input,
            const RequirementSet& requirements,
            FeasibilityReport& report
        );

        void checkAssignments(
            const RequirementSet& requirements,
            FeasibilityReport& report
        );

        void add(FeasibilityReport& report, const Obstruction& o);
};
