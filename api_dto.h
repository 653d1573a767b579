#pragma once

#include <string>
#include <vector>

#include "availability.h"
#include "model.h"
#include "requirements.h"

// Ячейка для фронта: с именами вместо голых id
struct ScheduleCellView {
    int classId;
    std::string section;
    int day;
    std::string dayName;      // "Sunday"
    int period;               // с 1, как в школьном расписании
    int subjectId;
    std::string subjectName;
    int teacherId;
    std::string teacherName;
};

struct ScheduleGridView {
    int classId;
    std::string section;
    std::string name;         // имя опубликованного расписания, у превью пусто
    std::vector<ScheduleCellView> cells;
    std::vector<std::string> warnings;
};

struct TeacherAvailabilityView {
    int teacherId;
    std::string teacherName;
    AvailabilityGrid grid;
    int totalFree;
    int totalAssigned;
    int totalUnavailable;
};

std::vector<ScheduleGridView> buildGridViews(
    const std::vector<ScheduleGrid>& grids,
    const std::vector<Subject>& subjects,
    const std::vector<TeacherAvailability>& teachers
);

TeacherAvailabilityView buildAvailabilityView(const TeacherAvailability& teacher);
