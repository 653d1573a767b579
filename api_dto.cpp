#include "api_dto.h"

std::vector<ScheduleGridView> buildGridViews(
    const std::vector<ScheduleGrid>& grids,
    const std::vector<Subject>& subjects,
    const std::vector<TeacherAvailability>& teachers
) {
    std::vector<ScheduleGridView> result;

    for (const ScheduleGrid& grid : grids) {
        ScheduleGridView gv;
        gv.classId  = grid.classId;
        gv.section  = grid.section;
        gv.warnings = grid.warnings;

        for (const ScheduleCell& c : grid.cells) {
            ScheduleCellView v;
            v.classId     = c.classId;
            v.section     = c.section;
            v.day         = c.day;
            v.dayName     = dayName(c.day);
            v.period      = c.period + 1;
            v.subjectId   = c.subjectId;
            v.subjectName = subjectLabel(subjects, c.subjectId);
            v.teacherId   = c.teacherId;
            v.teacherName = teacherLabel(teachers, c.teacherId);
            gv.cells.push_back(v);
        }

        result.push_back(gv);
    }

    return result;
}

TeacherAvailabilityView buildAvailabilityView(const TeacherAvailability& teacher) {
    TeacherAvailabilityView v;
    v.teacherId        = teacher.teacherId;
    v.teacherName      = teacher.teacherName;
    v.grid             = teacher.grid;
    v.totalFree        = teacher.grid.countInState(SlotState::Free);
    v.totalAssigned    = teacher.grid.countInState(SlotState::Assigned);
    v.totalUnavailable = teacher.grid.countInState(SlotState::Unavailable);
    return v;
}
