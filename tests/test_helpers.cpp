#include "test_helpers.h"

Subject makeSubject(int id, int classId, const std::string& name, int weeklyHours) {
    return Subject{id, classId, name, weeklyHours};
}

TeacherAssignment generalAssignment(int teacherId, int subjectId, int classId) {
    return TeacherAssignment{teacherId, subjectId, classId, std::nullopt};
}

TeacherAssignment sectionAssignment(int teacherId, int subjectId, int classId, const std::string& section) {
    return TeacherAssignment{teacherId, subjectId, classId, section};
}

TeacherAvailability freeTeacher(int id, const std::string& name) {
    return TeacherAvailability{id, name, AvailabilityGrid::allFree()};
}

TeacherAvailability partlyFreeTeacher(int id, const std::string& name, int freeCount) {
    AvailabilityGrid grid;
    for (int slot = 0; slot < freeCount && slot < kSlotsPerWeek; ++slot) {
        grid.setState(slotDay(slot), slotPeriod(slot), SlotState::Free);
    }
    return TeacherAvailability{id, name, grid};
}

Constraint forbiddenSlot(int id, int day, int period) {
    Constraint c;
    c.id     = id;
    c.type   = ConstraintType::Forbidden;
    c.day    = day;
    c.period = period;
    return c;
}

GenerationInput sixSubjectInput(int classId, int sectionCount, int teacherBase) {
    GenerationInput input;
    input.academicYearId = kYear;
    input.sessionType    = SessionType::Morning;
    input.schoolClass    = SchoolClass{classId, "Класс " + std::to_string(classId), sectionCount};

    for (int i = 1; i <= 6; ++i) {
        int subjectId = classId * 100 + i;
        int teacherId = teacherBase + i;
        input.subjects.push_back(makeSubject(subjectId, classId, "Предмет " + std::to_string(i), 5));
        input.assignments.push_back(generalAssignment(teacherId, subjectId, classId));
        input.teachers.push_back(freeTeacher(teacherId, "Учитель " + std::to_string(teacherId)));
    }
    return input;
}

void seedSixSubjectClass(MemoryScheduleStore& store, int classId, int sectionCount,
                         int teacherBase, bool addTeachers) {
    GenerationInput input = sixSubjectInput(classId, sectionCount, teacherBase);

    store.addClass(input.schoolClass, kYear, SessionType::Morning);
    for (const Subject& s : input.subjects) store.addSubject(s);
    for (const TeacherAssignment& a : input.assignments) store.addAssignment(a);
    if (addTeachers) {
        for (const TeacherAvailability& t : input.teachers) store.addTeacher(t);
    }
}
