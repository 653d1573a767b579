#include "service.h"

#include "conflicts.h"
#include "errors.h"
#include "feasibility.h"
#include "generator.h"
#include "jwt_utils.h"
#include "logger.h"
#include "validator.h"

#include <algorithm>
#include <set>

std::string previewStateToString(PreviewState state) {
    switch (state) {
        case PreviewState::Requested:    return "requested";
        case PreviewState::Validating:   return "validating";
        case PreviewState::Generating:   return "generating";
        case PreviewState::PreviewReady: return "preview_ready";
        case PreviewState::Published:    return "published";
        case PreviewState::Discarded:    return "discarded";
    }
    return "unknown";
}

static std::string requestLabel(const ScheduleRequest& r) {
    std::string label = "год=" + std::to_string(r.academicYearId) +
                        " смена=" + sessionTypeToString(r.sessionType) +
                        " класс=" + std::to_string(r.classId);
    if (r.section) label += " секция=" + *r.section;
    return label;
}

static void transition(Preview& p, PreviewState next) {
    logInfo("[Workflow] " + requestLabel(p.request) + ": " +
            previewStateToString(p.state) + " -> " + previewStateToString(next));
    p.state = next;
}

TimetableService::TimetableService(ScheduleStore& store, std::chrono::seconds previewTtl)
    : store_(store), previewTtl_(previewTtl) {}

std::shared_ptr<std::mutex> TimetableService::lockFor(int academicYearId, SessionType sessionType, int classId) {
    std::lock_guard<std::mutex> guard(locksMutex_);
    auto key = std::make_tuple(academicYearId, static_cast<int>(sessionType), classId);
    auto it = tupleLocks_.find(key);
    if (it == tupleLocks_.end()) {
        it = tupleLocks_.emplace(key, std::make_shared<std::mutex>()).first;
    }
    return it->second;
}

// ==================== проверка выполнимости ====================

FeasibilityReport TimetableService::validateFeasibility(int classId, SessionType sessionType, int academicYearId) {
    GenerationInput input = store_.loadGenerationInput(academicYearId, sessionType, classId);
    RequirementSet requirements = computeRequirements(input.schoolClass, input.subjects, input.assignments);

    FeasibilityValidator validator;
    return validator.checkAll(input, requirements);
}

// ==================== превью ====================

Preview TimetableService::buildPreview(const ScheduleRequest& request) {
    Preview preview;
    preview.request = request;
    preview.state   = PreviewState::Requested;
    logInfo("[Workflow] " + requestLabel(request) + ": requested");

    preview.input = store_.loadGenerationInput(request.academicYearId, request.sessionType, request.classId);
    preview.requirements = computeRequirements(preview.input.schoolClass, preview.input.subjects,
                                               preview.input.assignments);

    if (request.section) {
        const std::vector<std::string>& sections = preview.requirements.sections;
        if (std::find(sections.begin(), sections.end(), *request.section) == sections.end()) {
            throw NotFoundError("Секции '" + *request.section + "' нет в классе " +
                                preview.input.schoolClass.name);
        }
        preview.requirements = restrictToSection(preview.requirements, *request.section);
    }

    transition(preview, PreviewState::Validating);
    FeasibilityValidator feasibility;
    FeasibilityReport report = feasibility.checkAll(preview.input, preview.requirements);
    if (!report.feasible) {
        throw FeasibilityError(std::move(report));
    }

    transition(preview, PreviewState::Generating);
    preview.grids = generateClassSchedule(preview.input, preview.requirements);

    // последний рубеж: при нарушении вся партия сеток выбрасывается
    GridIntegrityValidator integrity;
    integrity.enforce(preview.input, preview.requirements, preview.grids);

    transition(preview, PreviewState::PreviewReady);
    return preview;
}

Preview TimetableService::generatePreview(const ScheduleRequest& request) {
    std::shared_ptr<std::mutex> tupleLock = lockFor(request.academicYearId, request.sessionType, request.classId);
    std::lock_guard<std::mutex> guard(*tupleLock);

    Preview preview = buildPreview(request);
    preview.token     = generateOpaqueToken(24);
    preview.createdAt = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(previewsMutex_);
        evictPreviews(request, preview.createdAt);
        preview.sequence = ++nextSequence_;
        previews_[preview.token] = preview;
    }

    logInfo("Превью готово: " + requestLabel(request) + ", сеток " +
            std::to_string(preview.grids.size()));
    return preview;
}

bool TimetableService::expired(const Preview& preview, std::chrono::steady_clock::time_point now) const {
    return now - preview.createdAt >= previewTtl_;
}

void TimetableService::evictPreviews(const ScheduleRequest& incoming, std::chrono::steady_clock::time_point now) {
    std::vector<std::pair<unsigned long long, std::string>> sameClass;

    for (auto it = previews_.begin(); it != previews_.end();) {
        const ScheduleRequest& r = it->second.request;
        if (expired(it->second, now)) {
            logInfo("[Workflow] " + requestLabel(r) + ": превью просрочено и удалено");
            it = previews_.erase(it);
            continue;
        }
        if (r.academicYearId == incoming.academicYearId && r.sessionType == incoming.sessionType &&
            r.classId == incoming.classId) {
            sameClass.push_back({it->second.sequence, it->first});
        }
        ++it;
    }

    // место под новое превью: уходят самые старые
    std::sort(sameClass.begin(), sameClass.end());
    size_t excess = sameClass.size() + 1 > kMaxPreviewsPerClass
                        ? sameClass.size() + 1 - kMaxPreviewsPerClass : 0;
    for (size_t i = 0; i < excess; ++i) {
        auto it = previews_.find(sameClass[i].second);
        transition(it->second, PreviewState::Discarded);
        previews_.erase(it);
    }
}

std::optional<Preview> TimetableService::findPreview(const std::string& previewToken) const {
    std::lock_guard<std::mutex> lock(previewsMutex_);
    auto it = previews_.find(previewToken);
    if (it == previews_.end()) return std::nullopt;
    if (expired(it->second, std::chrono::steady_clock::now())) return std::nullopt;
    return it->second;
}

bool TimetableService::discardPreview(const std::string& previewToken) {
    std::lock_guard<std::mutex> lock(previewsMutex_);
    auto it = previews_.find(previewToken);
    if (it == previews_.end()) {
        return false;
    }
    transition(it->second, PreviewState::Discarded);
    previews_.erase(it);
    return true;
}

// ==================== публикация ====================

PublishResult TimetableService::commitGrids(const Preview& preview, const std::string& name) {
    const ScheduleRequest& req = preview.request;

    std::unique_ptr<StoreTransaction> tx = store_.begin();

    for (const ScheduleGrid& grid : preview.grids) {
        ScheduleKey key{req.academicYearId, req.sessionType, req.classId, grid.section};
        if (tx->isPublished(key)) {
            throw NameConflictError(
                "already_published",
                "Расписание класса " + preview.input.schoolClass.name + ", секция " + grid.section +
                " уже опубликовано для этого года и смены");
        }
    }

    if (!name.empty() && tx->isNameTaken(req.academicYearId, req.sessionType, req.classId, name)) {
        throw NameConflictError("duplicate_name", "Имя расписания '" + name + "' уже занято");
    }

    std::vector<int> teacherIds;
    for (const ScheduleGrid& grid : preview.grids) {
        for (const ScheduleCell& c : grid.cells) {
            if (std::find(teacherIds.begin(), teacherIds.end(), c.teacherId) == teacherIds.end()) {
                teacherIds.push_back(c.teacherId);
            }
        }
    }

    // Доступность читаем сейчас, а не на момент превью
    std::vector<TeacherAvailability> locked = tx->lockTeachers(teacherIds);
    std::map<int, TeacherAvailability*> byId;
    for (TeacherAvailability& t : locked) byId[t.teacherId] = &t;

    std::vector<AvailabilityConflict> stale;
    for (const ScheduleGrid& grid : preview.grids) {
        for (const ScheduleCell& c : grid.cells) {
            auto it = byId.find(c.teacherId);
            if (it != byId.end() && it->second->grid.isFree(c.day, c.period)) continue;

            AvailabilityConflict conflict;
            conflict.teacherId   = c.teacherId;
            conflict.teacherName = it != byId.end() ? it->second->teacherName
                                                    : teacherLabel(preview.input.teachers, c.teacherId);
            conflict.day         = c.day;
            conflict.period      = c.period;
            stale.push_back(conflict);
        }
    }
    if (!stale.empty()) {
        logWarning("Публикация отклонена: занятых слотов учителей " + std::to_string(stale.size()));
        throw AvailabilityConflictError(std::move(stale));
    }

    PublishResult result;
    result.publishedCount = 0;

    for (const ScheduleGrid& grid : preview.grids) {
        for (const ScheduleCell& c : grid.cells) {
            tx->insertCell(req.academicYearId, req.sessionType, c, name);
            byId[c.teacherId]->grid.markAssigned(c.day, c.period);
            result.publishedCount++;
        }
        result.sections.push_back(grid.section);
    }

    for (const TeacherAvailability& t : locked) {
        tx->saveAvailability(t.teacherId, t.grid);
        result.teachersUpdated.push_back(t.teacherId);
    }

    tx->commit();
    return result;
}

PublishResult TimetableService::publish(const std::string& previewToken,
                                        const std::optional<std::string>& nameOverride) {
    std::optional<Preview> found = findPreview(previewToken);
    if (!found) {
        throw NotFoundError("Превью не найдено или уже опубликовано");
    }
    Preview preview = std::move(*found);

    std::shared_ptr<std::mutex> tupleLock =
        lockFor(preview.request.academicYearId, preview.request.sessionType, preview.request.classId);
    std::lock_guard<std::mutex> guard(*tupleLock);

    std::string name = nameOverride.value_or(preview.request.name);
    PublishResult result = commitGrids(preview, name);

    {
        std::lock_guard<std::mutex> lock(previewsMutex_);
        auto it = previews_.find(previewToken);
        if (it != previews_.end()) {
            transition(it->second, PreviewState::Published);
            previews_.erase(it);
        }
    }

    logInfo("Опубликовано: " + requestLabel(preview.request) + ", ячеек " +
            std::to_string(result.publishedCount));
    return result;
}

PublishResult TimetableService::publishRegenerated(const ScheduleRequest& request) {
    std::shared_ptr<std::mutex> tupleLock = lockFor(request.academicYearId, request.sessionType, request.classId);
    std::lock_guard<std::mutex> guard(*tupleLock);

    Preview preview = buildPreview(request);
    PublishResult result = commitGrids(preview, request.name);
    transition(preview, PreviewState::Published);

    logInfo("Опубликовано после перегенерации: " + requestLabel(request) + ", ячеек " +
            std::to_string(result.publishedCount));
    return result;
}

// ==================== удаление ====================

DeleteResult TimetableService::deleteClassSchedule(const ScheduleKey& key) {
    std::shared_ptr<std::mutex> tupleLock = lockFor(key.academicYearId, key.sessionType, key.classId);
    std::lock_guard<std::mutex> guard(*tupleLock);

    std::unique_ptr<StoreTransaction> tx = store_.begin();

    std::vector<ScheduleCell> cells = tx->findCells(key);
    if (cells.empty()) {
        throw NotFoundError("Нет опубликованного расписания: класс " + std::to_string(key.classId) +
                            ", секция " + key.section + ", год " + std::to_string(key.academicYearId) +
                            ", смена " + sessionTypeToString(key.sessionType));
    }

    std::vector<int> teacherIds;
    for (const ScheduleCell& c : cells) {
        if (std::find(teacherIds.begin(), teacherIds.end(), c.teacherId) == teacherIds.end()) {
            teacherIds.push_back(c.teacherId);
        }
    }

    std::vector<TeacherAvailability> locked = tx->lockTeachers(teacherIds);
    std::map<int, TeacherAvailability*> byId;
    for (TeacherAvailability& t : locked) byId[t.teacherId] = &t;

    // возвращаем ровно те слоты, что принадлежали этой сетке
    std::set<int> restoredIds;
    for (const ScheduleCell& c : cells) {
        auto it = byId.find(c.teacherId);
        if (it == byId.end()) {
            logWarning("Учитель id=" + std::to_string(c.teacherId) + " из удаляемой сетки не найден");
            continue;
        }
        if (it->second->grid.releaseAssigned(c.day, c.period)) {
            restoredIds.insert(c.teacherId);
        } else {
            logWarning("Слот " + dayName(c.day) + "/" + std::to_string(c.period + 1) + " учителя " +
                       it->second->teacherName + " не был отмечен занятым");
        }
    }

    DeleteResult result;
    result.deletedCount = tx->deleteCells(key);

    for (int teacherId : teacherIds) {
        if (!restoredIds.count(teacherId)) continue;
        tx->saveAvailability(teacherId, byId[teacherId]->grid);
        result.restoredTeachers.push_back(byId[teacherId]->teacherName);
    }

    tx->commit();

    logInfo("Удалено расписание класса " + std::to_string(key.classId) + ", секция " + key.section +
            ": ячеек " + std::to_string(result.deletedCount) +
            ", восстановлено учителей " + std::to_string(result.restoredTeachers.size()));
    return result;
}

// ==================== конфликты ====================

std::vector<ConflictDetail> TimetableService::resolveConflicts(
    int classId,
    const std::optional<int>& academicYearId,
    const std::optional<SessionType>& sessionType
) {
    std::vector<PublishedCell> cells = store_.loadPublishedCells(academicYearId, sessionType);

    std::set<std::pair<int, int>> scopes; // (год, смена) где у класса есть сетки
    std::vector<int> teacherIds;
    for (const PublishedCell& pc : cells) {
        if (pc.cell.classId != classId) continue;
        scopes.insert({pc.academicYearId, static_cast<int>(pc.sessionType)});
        if (std::find(teacherIds.begin(), teacherIds.end(), pc.cell.teacherId) == teacherIds.end()) {
            teacherIds.push_back(pc.cell.teacherId);
        }
    }

    std::vector<ConflictDetail> result;
    if (scopes.empty()) {
        logInfo("Класс " + std::to_string(classId) + ": опубликованных сеток нет, конфликтов нет");
        return result;
    }

    std::vector<TeacherAvailability> teachers = store_.loadTeachers(teacherIds);

    for (const auto& scope : scopes) {
        SessionType session = static_cast<SessionType>(scope.second);
        std::vector<Constraint> constraints = store_.loadConstraints(scope.first, session);
        std::vector<ConflictDetail> found = findConflicts(classId, scope.first, session, cells, constraints, teachers);
        result.insert(result.end(), found.begin(), found.end());
    }

    return result;
}

TeacherAvailabilityView TimetableService::getTeacherAvailability(int teacherId) {
    std::vector<TeacherAvailability> teachers = store_.loadTeachers({teacherId});
    if (teachers.empty()) {
        throw NotFoundError("Учитель id=" + std::to_string(teacherId) + " не найден");
    }
    return buildAvailabilityView(teachers.front());
}

// ==================== недельный вид ====================

WeeklyView TimetableService::getWeeklyView(
    int academicYearId,
    SessionType sessionType,
    const std::optional<int>& classId,
    const std::optional<int>& teacherId
) {
    WeeklyView view;
    view.academicYearId = academicYearId;
    view.sessionType    = sessionType;
    view.classId        = classId;
    view.teacherId      = teacherId;
    view.totalCells     = 0;

    std::vector<PublishedCell> cells = store_.loadPublishedCells(academicYearId, sessionType);

    // (класс, секция) -> сетка; порядок map даёт стабильный вывод
    std::map<std::pair<int, std::string>, ScheduleGrid> grids;
    std::map<std::pair<int, std::string>, std::string> names;
    std::vector<int> teacherIds;
    std::vector<int> subjectIds;

    for (const PublishedCell& pc : cells) {
        const ScheduleCell& c = pc.cell;
        if (classId && c.classId != *classId) continue;
        if (teacherId && c.teacherId != *teacherId) continue;

        auto key = std::make_pair(c.classId, c.section);
        auto it = grids.find(key);
        if (it == grids.end()) {
            ScheduleGrid g;
            g.academicYearId = academicYearId;
            g.sessionType    = sessionType;
            g.classId        = c.classId;
            g.section        = c.section;
            it = grids.emplace(key, g).first;
            names[key] = pc.name;
        }
        it->second.cells.push_back(c);
        view.totalCells++;

        if (std::find(teacherIds.begin(), teacherIds.end(), c.teacherId) == teacherIds.end()) {
            teacherIds.push_back(c.teacherId);
        }
        if (std::find(subjectIds.begin(), subjectIds.end(), c.subjectId) == subjectIds.end()) {
            subjectIds.push_back(c.subjectId);
        }
    }

    std::vector<ScheduleGrid> ordered;
    for (auto& g : grids) {
        std::sort(g.second.cells.begin(), g.second.cells.end(),
            [](const ScheduleCell& a, const ScheduleCell& b) {
                return slotIndex(a.day, a.period) < slotIndex(b.day, b.period);
            }
        );
        ordered.push_back(g.second);
    }

    view.grids = buildGridViews(ordered, store_.loadSubjects(subjectIds), store_.loadTeachers(teacherIds));
    for (ScheduleGridView& gv : view.grids) {
        gv.name = names[{gv.classId, gv.section}];
    }

    logDebug("Недельный вид: год=" + std::to_string(academicYearId) + " смена=" +
             sessionTypeToString(sessionType) + ", сеток " + std::to_string(view.grids.size()));
    return view;
}
