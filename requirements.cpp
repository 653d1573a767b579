#include "requirements.h"
#include "logger.h"

#include <algorithm>
#include <map>
#include <stdexcept>

const Subject* findSubjectById(const std::vector<Subject>& subjects, int subjectId) {
    for (const Subject& s : subjects) if (s.id == subjectId) return &s;
    return nullptr;
}

const TeacherAvailability* findTeacherById(const std::vector<TeacherAvailability>& teachers, int teacherId) {
    for (const TeacherAvailability& t : teachers) if (t.teacherId == teacherId) return &t;
    return nullptr;
}

std::string subjectLabel(const std::vector<Subject>& subjects, int subjectId) {
    const Subject* s = findSubjectById(subjects, subjectId);
    if (!s) return "предмет #" + std::to_string(subjectId);
    return s->name;
}

std::string teacherLabel(const std::vector<TeacherAvailability>& teachers, int teacherId) {
    const TeacherAvailability* t = findTeacherById(teachers, teacherId);
    if (!t || t->teacherName.empty()) return "учитель #" + std::to_string(teacherId);
    return t->teacherName;
}

std::vector<std::string> sectionNames(const SchoolClass& schoolClass) {
    int count = schoolClass.sectionCount > 0 ? schoolClass.sectionCount : 1;
    std::vector<std::string> names;
    for (int i = 1; i <= count; ++i) {
        names.push_back(std::to_string(i));
    }
    return names;
}

RequirementSet computeRequirements(
    const SchoolClass& schoolClass,
    const std::vector<Subject>& subjects,
    const std::vector<TeacherAssignment>& assignments
) {
    RequirementSet result;
    result.sections = sectionNames(schoolClass);

    std::vector<const Subject*> classSubjects;
    for (const Subject& s : subjects) {
        if (s.classId == schoolClass.id) classSubjects.push_back(&s);
    }
    std::sort(classSubjects.begin(), classSubjects.end(),
        [](const Subject* a, const Subject* b) { return a->id < b->id; });

    for (const Subject* subject : classSubjects) {
        if (subject->weeklyHours <= 0) {
            logDebug("Предмет " + subject->name + " без недельных часов, пропускаем");
            continue;
        }

        std::vector<int> generalTeachers;
        std::map<std::string, std::vector<int>> sectionTeachers;

        for (const TeacherAssignment& a : assignments) {
            if (a.classId != schoolClass.id || a.subjectId != subject->id) continue;

            if (!a.section.has_value() || a.section->empty()) {
                generalTeachers.push_back(a.teacherId);
                continue;
            }
            if (std::find(result.sections.begin(), result.sections.end(), *a.section) ==
                result.sections.end()) {
                logWarning("Назначение учителя id=" + std::to_string(a.teacherId) +
                           " на несуществующую секцию '" + *a.section +
                           "' класса " + schoolClass.name + " проигнорировано");
                continue;
            }
            sectionTeachers[*a.section].push_back(a.teacherId);
        }

        std::sort(generalTeachers.begin(), generalTeachers.end());
        generalTeachers.erase(std::unique(generalTeachers.begin(), generalTeachers.end()),
                              generalTeachers.end());

        if (generalTeachers.size() > 1) {
            Obstruction o;
            o.kind      = ObstructionKind::AmbiguousAssignment;
            o.classId   = schoolClass.id;
            o.subjectId = subject->id;
            o.message   = "Предмет " + subject->name + " назначен сразу " +
                          std::to_string(generalTeachers.size()) +
                          " учителям на все секции";
            result.assignmentIssues.push_back(o);
        }

        std::vector<std::string> uncovered;
        std::vector<std::string> missing;

        for (const std::string& section : result.sections) {
            auto it = sectionTeachers.find(section);
            if (it == sectionTeachers.end()) {
                if (generalTeachers.empty()) missing.push_back(section);
                else uncovered.push_back(section);
                continue;
            }

            std::vector<int>& ids = it->second;
            std::sort(ids.begin(), ids.end());
            ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

            if (ids.size() > 1) {
                Obstruction o;
                o.kind      = ObstructionKind::AmbiguousAssignment;
                o.classId   = schoolClass.id;
                o.section   = section;
                o.subjectId = subject->id;
                o.message   = "Предмет " + subject->name + " в секции " + section +
                              " назначен сразу " + std::to_string(ids.size()) + " учителям";
                result.assignmentIssues.push_back(o);
            }

            SubjectRequirement r;
            r.classId         = schoolClass.id;
            r.subjectId       = subject->id;
            r.teacherId       = ids.front();
            r.section         = section;
            r.hoursPerSection = subject->weeklyHours;
            r.weeklyHoursOwed = subject->weeklyHours;
            r.sections        = {section};
            result.requirements.push_back(r);
        }

        if (!uncovered.empty()) {
            SubjectRequirement r;
            r.classId         = schoolClass.id;
            r.subjectId       = subject->id;
            r.teacherId       = generalTeachers.front();
            r.section         = std::nullopt;
            r.hoursPerSection = subject->weeklyHours;
            r.weeklyHoursOwed = subject->weeklyHours * (int)uncovered.size();
            r.sections        = uncovered;
            result.requirements.push_back(r);
        }

        if (!missing.empty()) {
            Obstruction o;
            o.kind      = ObstructionKind::MissingTeacher;
            o.classId   = schoolClass.id;
            o.subjectId = subject->id;
            o.required  = subject->weeklyHours * (int)missing.size();
            o.shortfall = o.required;
            if (missing.size() == result.sections.size()) {
                o.message = "У предмета " + subject->name + " нет назначенного учителя";
            } else {
                std::string list;
                for (const std::string& s : missing) {
                    if (!list.empty()) list += ", ";
                    list += s;
                }
                o.section = missing.front();
                o.message = "У предмета " + subject->name +
                            " нет учителя в секциях: " + list;
            }
            result.assignmentIssues.push_back(o);
        }
    }

    logDebug("Класс " + schoolClass.name + ": секций=" + std::to_string(result.sections.size()) +
             ", требований=" + std::to_string(result.requirements.size()));

    return result;
}

std::vector<const SubjectRequirement*> requirementsForSection(
    const RequirementSet& set,
    const std::string& section
) {
    std::vector<const SubjectRequirement*> out;
    for (const SubjectRequirement& r : set.requirements) {
        if (std::find(r.sections.begin(), r.sections.end(), section) != r.sections.end()) {
            out.push_back(&r);
        }
    }
    return out;
}

RequirementSet restrictToSection(const RequirementSet& set, const std::string& section) {
    if (std::find(set.sections.begin(), set.sections.end(), section) == set.sections.end()) {
        throw std::invalid_argument("Секции '" + section + "' нет в классе");
    }

    RequirementSet result;
    result.sections = {section};

    for (const SubjectRequirement* r : requirementsForSection(set, section)) {
        SubjectRequirement one = *r;
        one.sections        = {section};
        one.weeklyHoursOwed = r->hoursPerSection;
        result.requirements.push_back(one);
    }

    for (const Obstruction& o : set.assignmentIssues) {
        if (o.kind == ObstructionKind::MissingTeacher) {
            // предмет без учителя именно в этой секции
            bool covered = false;
            for (const SubjectRequirement& r : result.requirements) {
                if (o.subjectId && r.subjectId == *o.subjectId) covered = true;
            }
            if (covered) continue;
        } else if (o.section && *o.section != section) {
            continue;
        }
        result.assignmentIssues.push_back(o);
    }

    return result;
}
