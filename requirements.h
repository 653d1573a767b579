#pragma once

#include <string>
#include <vector>

#include "availability.h"
#include "model.h"

// Всё, что нужно для одного запуска генерации по классу.
// Собирается хранилищем заново на каждый запрос.
struct GenerationInput {
    int academicYearId;
    SessionType sessionType;
    SchoolClass schoolClass;
    std::vector<Subject> subjects;
    std::vector<TeacherAssignment> assignments;
    std::vector<TeacherAvailability> teachers;
    std::vector<Constraint> constraints;
};

struct RequirementSet {
    std::vector<std::string> sections;
    std::vector<SubjectRequirement> requirements;
    // MissingTeacher / AmbiguousAssignment, найденные при расчёте
    std::vector<Obstruction> assignmentIssues;
};

std::vector<std::string> sectionNames(const SchoolClass& schoolClass);

RequirementSet computeRequirements(
    const SchoolClass& schoolClass,
    const std::vector<Subject>& subjects,
    const std::vector<TeacherAssignment>& assignments
);

// Набор требований только для одной секции: часы считаются за неё одну,
// проблемы назначений других секций отбрасываются.
// std::invalid_argument, если такой секции в классе нет.
RequirementSet restrictToSection(const RequirementSet& set, const std::string& section);

// Требования, действующие в конкретной секции
std::vector<const SubjectRequirement*> requirementsForSection(
    const RequirementSet& set,
    const std::string& section
);

const Subject* findSubjectById(const std::vector<Subject>& subjects, int subjectId);
const TeacherAvailability* findTeacherById(const std::vector<TeacherAvailability>& teachers, int teacherId);

std::string subjectLabel(const std::vector<Subject>& subjects, int subjectId);
std::string teacherLabel(const std::vector<TeacherAvailability>& teachers, int teacherId);
