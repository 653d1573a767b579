#pragma once

#include <string>
#include <vector>

#include "memory_store.h"
#include "model.h"
#include "requirements.h"

// Общие заготовки каталога для тестов

constexpr int kYear = 2025;

// Класс classId: 6 предметов по 5 часов (id = classId*100 + 1..6),
// учителя teacherBase + 1..6 свободны всю неделю, назначены на все секции.
GenerationInput sixSubjectInput(int classId, int sectionCount, int teacherBase = 0);

// Тот же каталог, разложенный в хранилище (класс в kYear, утренняя смена).
// addTeachers=false, если учителя уже добавлены вместе с другим классом.
void seedSixSubjectClass(MemoryScheduleStore& store, int classId, int sectionCount,
                         int teacherBase = 0, bool addTeachers = true);

Subject makeSubject(int id, int classId, const std::string& name, int weeklyHours);
TeacherAssignment generalAssignment(int teacherId, int subjectId, int classId);
TeacherAssignment sectionAssignment(int teacherId, int subjectId, int classId, const std::string& section);
TeacherAvailability freeTeacher(int id, const std::string& name);

// Учитель, свободный ровно в первых freeCount слотах недели
TeacherAvailability partlyFreeTeacher(int id, const std::string& name, int freeCount);

Constraint forbiddenSlot(int id, int day, int period);
