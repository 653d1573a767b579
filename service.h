#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "api_dto.h"
#include "model.h"
#include "requirements.h"
#include "store.h"

enum class PreviewState {
    Requested,
    Validating,
    Generating,
    PreviewReady,
    Published,
    Discarded
};

std::string previewStateToString(PreviewState state);

struct Preview {
    std::string token;
    ScheduleRequest request;
    PreviewState state;
    std::vector<ScheduleGrid> grids;
    GenerationInput input;        // снимок каталога на момент генерации
    RequirementSet requirements;
    std::chrono::steady_clock::time_point createdAt;
    unsigned long long sequence = 0; // порядок регистрации
};

// Опубликованные сетки года/смены, по классу и/или учителю
struct WeeklyView {
    int academicYearId;
    SessionType sessionType;
    std::optional<int> classId;
    std::optional<int> teacherId;
    int totalCells;
    std::vector<ScheduleGridView> grids;
};

struct PublishResult {
    int publishedCount;
    std::vector<std::string> sections;
    std::vector<int> teachersUpdated;
};

struct DeleteResult {
    int deletedCount;
    std::vector<std::string> restoredTeachers;
};

// Сценарии генерации / публикации / удаления расписания класса.
// Год и смена всегда передаются явно, глобального «текущего года» нет.
class TimetableService {
public:
    // Больше стольких превью на (год, смена, класс) не держим: старые вытесняются
    static constexpr size_t kMaxPreviewsPerClass = 3;

    // previewTtl: сколько живёт неопубликованное превью
    explicit TimetableService(ScheduleStore& store,
                              std::chrono::seconds previewTtl = std::chrono::minutes(30));

    FeasibilityReport validateFeasibility(int classId, SessionType sessionType, int academicYearId);

    // FeasibilityError / GenerationError / IntegrityViolation; в хранилище ничего не пишет.
    // request.section задан => генерируется только эта секция (NotFoundError, если её нет).
    Preview generatePreview(const ScheduleRequest& request);

    // Атомарно: ячейки + занятость учителей. nameOverride: для переименования
    // после NameConflictError без повторной генерации.
    PublishResult publish(const std::string& previewToken,
                          const std::optional<std::string>& nameOverride = std::nullopt);

    PublishResult publishRegenerated(const ScheduleRequest& request);

    // false, если такого превью нет
    bool discardPreview(const std::string& previewToken);

    std::optional<Preview> findPreview(const std::string& previewToken) const;

    DeleteResult deleteClassSchedule(const ScheduleKey& key);

    std::vector<ConflictDetail> resolveConflicts(
        int classId,
        const std::optional<int>& academicYearId = std::nullopt,
        const std::optional<SessionType>& sessionType = std::nullopt
    );

    TeacherAvailabilityView getTeacherAvailability(int teacherId);

    WeeklyView getWeeklyView(int academicYearId, SessionType sessionType,
                             const std::optional<int>& classId = std::nullopt,
                             const std::optional<int>& teacherId = std::nullopt);

private:
    ScheduleStore& store_;
    std::chrono::seconds previewTtl_;

    mutable std::mutex previewsMutex_;
    std::map<std::string, Preview> previews_;
    unsigned long long nextSequence_ = 0;

    std::mutex locksMutex_;
    std::map<std::tuple<int, int, int>, std::shared_ptr<std::mutex>> tupleLocks_;

    std::shared_ptr<std::mutex> lockFor(int academicYearId, SessionType sessionType, int classId);

    // под previewsMutex_
    void evictPreviews(const ScheduleRequest& incoming, std::chrono::steady_clock::time_point now);
    bool expired(const Preview& preview, std::chrono::steady_clock::time_point now) const;

    Preview buildPreview(const ScheduleRequest& request);
    PublishResult commitGrids(const Preview& preview, const std::string& name);
};
