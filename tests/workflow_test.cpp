#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "errors.h"
#include "memory_store.h"
#include "service.h"
#include "test_helpers.h"

// Хранилище, у которого запись обрывается на N-й ячейке или на сохранении доступности
class InterruptedTransaction : public StoreTransaction {
public:
    InterruptedTransaction(std::unique_ptr<StoreTransaction> inner, int failAtInsert, bool failOnSave)
        : inner_(std::move(inner)), failAtInsert_(failAtInsert), failOnSave_(failOnSave) {}

    std::vector<TeacherAvailability> lockTeachers(const std::vector<int>& teacherIds) override {
        return inner_->lockTeachers(teacherIds);
    }
    bool isPublished(const ScheduleKey& key) override { return inner_->isPublished(key); }
    bool isNameTaken(int academicYearId, SessionType sessionType, int classId, const std::string& name) override {
        return inner_->isNameTaken(academicYearId, sessionType, classId, name);
    }
    std::vector<ScheduleCell> findCells(const ScheduleKey& key) override { return inner_->findCells(key); }

    void insertCell(int academicYearId, SessionType sessionType,
                    const ScheduleCell& cell, const std::string& name) override {
        if (++inserted_ == failAtInsert_) {
            throw std::runtime_error("соединение с БД потеряно");
        }
        inner_->insertCell(academicYearId, sessionType, cell, name);
    }

    int deleteCells(const ScheduleKey& key) override { return inner_->deleteCells(key); }

    void saveAvailability(int teacherId, const AvailabilityGrid& grid) override {
        if (failOnSave_) {
            throw std::runtime_error("не удалось сохранить доступность");
        }
        inner_->saveAvailability(teacherId, grid);
    }

    void commit() override { inner_->commit(); }

private:
    std::unique_ptr<StoreTransaction> inner_;
    int failAtInsert_;
    bool failOnSave_;
    int inserted_ = 0;
};

class InterruptedStore : public ScheduleStore {
public:
    explicit InterruptedStore(ScheduleStore& inner) : inner_(inner) {}

    int failAtInsert = 0; // 0 => не обрывать
    bool failOnSave  = false;

    GenerationInput loadGenerationInput(int academicYearId, SessionType sessionType, int classId) override {
        return inner_.loadGenerationInput(academicYearId, sessionType, classId);
    }
    std::vector<PublishedCell> loadPublishedCells(
        const std::optional<int>& academicYearId,
        const std::optional<SessionType>& sessionType
    ) override {
        return inner_.loadPublishedCells(academicYearId, sessionType);
    }
    std::vector<Constraint> loadConstraints(int academicYearId, SessionType sessionType) override {
        return inner_.loadConstraints(academicYearId, sessionType);
    }
    std::vector<TeacherAvailability> loadTeachers(const std::vector<int>& teacherIds) override {
        return inner_.loadTeachers(teacherIds);
    }
    std::vector<Subject> loadSubjects(const std::vector<int>& subjectIds) override {
        return inner_.loadSubjects(subjectIds);
    }
    std::unique_ptr<StoreTransaction> begin() override {
        return std::make_unique<InterruptedTransaction>(inner_.begin(), failAtInsert, failOnSave);
    }

private:
    ScheduleStore& inner_;
};

class WorkflowTest : public ::testing::Test {
protected:
    ScheduleRequest requestFor(int classId, const std::string& name = "") const {
        return ScheduleRequest{kYear, SessionType::Morning, classId, name};
    }

    int assignedCount(int teacherId) const {
        return store.teacherAvailability(teacherId).countInState(SlotState::Assigned);
    }

    MemoryScheduleStore store;
    TimetableService service{store};
};

TEST_F(WorkflowTest, PublishWritesEveryCellAndMarksTeachers) {
    seedSixSubjectClass(store, 1, 1);

    Preview preview = service.generatePreview(requestFor(1));
    EXPECT_EQ(preview.state, PreviewState::PreviewReady);
    EXPECT_FALSE(preview.token.empty());

    PublishResult result = service.publish(preview.token);

    EXPECT_EQ(result.publishedCount, kSlotsPerWeek);
    ASSERT_EQ(result.sections.size(), 1u);
    EXPECT_EQ(result.teachersUpdated.size(), 6u);
    EXPECT_EQ(store.publishedCells().size(), static_cast<size_t>(kSlotsPerWeek));
    for (int teacherId = 1; teacherId <= 6; ++teacherId) {
        EXPECT_EQ(assignedCount(teacherId), 5);
    }
    EXPECT_FALSE(service.findPreview(preview.token).has_value());
}

TEST_F(WorkflowTest, PreviewAndDiscardLeaveStoreUntouched) {
    seedSixSubjectClass(store, 1, 2);

    Preview preview = service.generatePreview(requestFor(1));
    EXPECT_EQ(preview.grids.size(), 2u);
    EXPECT_TRUE(store.publishedCells().empty());
    EXPECT_EQ(store.teacherAvailability(1), AvailabilityGrid::allFree());

    EXPECT_TRUE(service.discardPreview(preview.token));
    EXPECT_FALSE(service.discardPreview(preview.token));
    EXPECT_THROW(service.publish(preview.token), NotFoundError);

    EXPECT_TRUE(store.publishedCells().empty());
    EXPECT_EQ(store.teacherAvailability(1), AvailabilityGrid::allFree());
}

TEST_F(WorkflowTest, InfeasibleClassProducesNoPreview) {
    seedSixSubjectClass(store, 1, 2);
    store.setTeacherAvailability(1, partlyFreeTeacher(1, "T1", 8).grid);

    try {
        service.generatePreview(requestFor(1));
        FAIL() << "FeasibilityError expected";
    } catch (const FeasibilityError& ex) {
        EXPECT_FALSE(ex.report().feasible);
        EXPECT_FALSE(ex.report().obstructions.empty());
    }
    EXPECT_TRUE(store.publishedCells().empty());
}

TEST_F(WorkflowTest, UnknownClassIsNotFound) {
    EXPECT_THROW(service.generatePreview(requestFor(9)), NotFoundError);
    EXPECT_THROW(service.validateFeasibility(9, SessionType::Morning, kYear), NotFoundError);
}

TEST_F(WorkflowTest, ClassIsScopedToYearAndSession) {
    seedSixSubjectClass(store, 1, 1);

    EXPECT_TRUE(service.validateFeasibility(1, SessionType::Morning, kYear).feasible);
    EXPECT_THROW(service.validateFeasibility(1, SessionType::Evening, kYear), NotFoundError);
    EXPECT_THROW(service.validateFeasibility(1, SessionType::Morning, kYear + 1), NotFoundError);
}

TEST_F(WorkflowTest, DeleteRestoresExactlyTheAssignedSlots) {
    seedSixSubjectClass(store, 1, 1);
    AvailabilityGrid before = AvailabilityGrid::allFree();
    before.setState(4, 0, SlotState::Unavailable);
    store.setTeacherAvailability(1, before);

    service.publish(service.generatePreview(requestFor(1)).token);

    DeleteResult result = service.deleteClassSchedule(ScheduleKey{kYear, SessionType::Morning, 1, "1"});

    EXPECT_EQ(result.deletedCount, kSlotsPerWeek);
    EXPECT_EQ(result.restoredTeachers.size(), 6u);
    EXPECT_TRUE(store.publishedCells().empty());
    EXPECT_EQ(store.teacherAvailability(1), before);
    EXPECT_EQ(store.teacherAvailability(6), AvailabilityGrid::allFree());
}

TEST_F(WorkflowTest, PublishDeleteRepublishRoundTrip) {
    seedSixSubjectClass(store, 1, 1);
    ScheduleKey key{kYear, SessionType::Morning, 1, "1"};

    service.publish(service.generatePreview(requestFor(1)).token);
    service.deleteClassSchedule(key);

    PublishResult again = service.publish(service.generatePreview(requestFor(1)).token);
    EXPECT_EQ(again.publishedCount, kSlotsPerWeek);
    EXPECT_EQ(assignedCount(1), 5);
}

TEST_F(WorkflowTest, DeleteWithoutPublishedScheduleChangesNothing) {
    seedSixSubjectClass(store, 1, 1);

    EXPECT_THROW(service.deleteClassSchedule(ScheduleKey{kYear, SessionType::Morning, 1, "1"}),
                 NotFoundError);
    EXPECT_EQ(store.teacherAvailability(1), AvailabilityGrid::allFree());
}

TEST_F(WorkflowTest, StalePreviewIsRejectedWithConflictingSlots) {
    seedSixSubjectClass(store, 1, 1);
    seedSixSubjectClass(store, 2, 1, 0, false); // те же учителя 1..6

    Preview first  = service.generatePreview(requestFor(1));
    Preview second = service.generatePreview(requestFor(2));

    service.publish(first.token);
    AvailabilityGrid afterFirst = store.teacherAvailability(1);

    try {
        service.publish(second.token);
        FAIL() << "AvailabilityConflictError expected";
    } catch (const AvailabilityConflictError& ex) {
        EXPECT_EQ(ex.code(), "availability_conflict");
        EXPECT_FALSE(ex.conflicts().empty());
    }

    EXPECT_EQ(store.publishedCells().size(), static_cast<size_t>(kSlotsPerWeek));
    EXPECT_EQ(store.teacherAvailability(1), afterFirst);

    // перегенерация против текущей занятости проходит
    PublishResult regenerated = service.publishRegenerated(requestFor(2));
    EXPECT_EQ(regenerated.publishedCount, kSlotsPerWeek);
    EXPECT_EQ(assignedCount(1), 10);
}

TEST_F(WorkflowTest, SecondPublishOfSameSectionIsNameConflict) {
    seedSixSubjectClass(store, 1, 1);

    service.publish(service.generatePreview(requestFor(1)).token);

    Preview duplicate = service.generatePreview(requestFor(1));
    try {
        service.publish(duplicate.token);
        FAIL() << "NameConflictError expected";
    } catch (const NameConflictError& ex) {
        EXPECT_EQ(ex.reason(), "already_published");
    }
    EXPECT_EQ(store.publishedCells().size(), static_cast<size_t>(kSlotsPerWeek));
}

TEST_F(WorkflowTest, DuplicateNameCanBeRetriedUnderAnotherName) {
    seedSixSubjectClass(store, 1, 1);
    seedSixSubjectClass(store, 2, 1, 10);

    service.publish(service.generatePreview(requestFor(1, "Основное")).token);

    Preview other = service.generatePreview(requestFor(2, "Основное"));
    try {
        service.publish(other.token);
        FAIL() << "NameConflictError expected";
    } catch (const NameConflictError& ex) {
        EXPECT_EQ(ex.reason(), "duplicate_name");
    }

    PublishResult result = service.publish(other.token, std::string("Второе"));
    EXPECT_EQ(result.publishedCount, kSlotsPerWeek);
}

TEST_F(WorkflowTest, ConcurrentPublishesOfConflictingPreviewsCommitOnlyOne) {
    seedSixSubjectClass(store, 1, 1);
    seedSixSubjectClass(store, 2, 1, 0, false);

    Preview first  = service.generatePreview(requestFor(1));
    Preview second = service.generatePreview(requestFor(2));

    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};
    auto attempt = [&](const std::string& token) {
        try {
            service.publish(token);
            ++succeeded;
        } catch (const AvailabilityConflictError&) {
            ++rejected;
        }
    };

    std::thread a(attempt, first.token);
    std::thread b(attempt, second.token);
    a.join();
    b.join();

    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(rejected.load(), 1);
    EXPECT_EQ(assignedCount(1), 5);
}

TEST_F(WorkflowTest, TeacherAvailabilityViewCountsStates) {
    seedSixSubjectClass(store, 1, 1);
    service.publish(service.generatePreview(requestFor(1)).token);

    TeacherAvailabilityView view = service.getTeacherAvailability(1);
    EXPECT_EQ(view.totalAssigned, 5);
    EXPECT_EQ(view.totalFree, kSlotsPerWeek - 5);
    EXPECT_EQ(view.totalUnavailable, 0);

    EXPECT_THROW(service.getTeacherAvailability(404), NotFoundError);
}

TEST_F(WorkflowTest, SingleSectionCanBeRepublishedAfterDelete) {
    seedSixSubjectClass(store, 1, 2);

    service.publish(service.generatePreview(requestFor(1)).token);
    EXPECT_EQ(assignedCount(1), 10);

    service.deleteClassSchedule(ScheduleKey{kYear, SessionType::Morning, 1, "1"});
    EXPECT_EQ(assignedCount(1), 5);

    ScheduleRequest request = requestFor(1);
    request.section = "1";
    Preview preview = service.generatePreview(request);
    ASSERT_EQ(preview.grids.size(), 1u);
    EXPECT_EQ(preview.grids[0].section, "1");
    EXPECT_EQ(preview.grids[0].cells.size(), static_cast<size_t>(kSlotsPerWeek));

    PublishResult result = service.publish(preview.token);
    EXPECT_EQ(result.publishedCount, kSlotsPerWeek);
    ASSERT_EQ(result.sections.size(), 1u);
    EXPECT_EQ(result.sections[0], "1");
    EXPECT_EQ(store.publishedCells().size(), static_cast<size_t>(2 * kSlotsPerWeek));
    for (int teacherId = 1; teacherId <= 6; ++teacherId) {
        EXPECT_EQ(assignedCount(teacherId), 10);
    }
    EXPECT_TRUE(service.resolveConflicts(1, kYear, SessionType::Morning).empty());
}

TEST_F(WorkflowTest, UnknownSectionIsNotFound) {
    seedSixSubjectClass(store, 1, 2);

    ScheduleRequest request = requestFor(1);
    request.section = "3";
    EXPECT_THROW(service.generatePreview(request), NotFoundError);
}

TEST_F(WorkflowTest, InterruptedInsertLeavesNothingBehind) {
    seedSixSubjectClass(store, 1, 1);
    InterruptedStore interrupted{store};
    interrupted.failAtInsert = 12;
    TimetableService flaky{interrupted};

    Preview preview = flaky.generatePreview(requestFor(1));
    EXPECT_THROW(flaky.publish(preview.token), std::runtime_error);

    EXPECT_TRUE(store.publishedCells().empty());
    for (int teacherId = 1; teacherId <= 6; ++teacherId) {
        EXPECT_EQ(store.teacherAvailability(teacherId), AvailabilityGrid::allFree());
    }

    // превью не потеряно, повтор проходит
    interrupted.failAtInsert = 0;
    PublishResult result = flaky.publish(preview.token);
    EXPECT_EQ(result.publishedCount, kSlotsPerWeek);
    EXPECT_EQ(assignedCount(1), 5);
}

TEST_F(WorkflowTest, FailedAvailabilityWriteRollsBackCells) {
    seedSixSubjectClass(store, 1, 1);
    InterruptedStore interrupted{store};
    interrupted.failOnSave = true;
    TimetableService flaky{interrupted};

    EXPECT_THROW(flaky.publishRegenerated(requestFor(1)), std::runtime_error);

    EXPECT_TRUE(store.publishedCells().empty());
    for (int teacherId = 1; teacherId <= 6; ++teacherId) {
        EXPECT_EQ(store.teacherAvailability(teacherId), AvailabilityGrid::allFree());
    }
}

TEST_F(WorkflowTest, OldestPreviewsOfClassAreEvicted) {
    seedSixSubjectClass(store, 1, 1);
    seedSixSubjectClass(store, 2, 1, 10);

    Preview other = service.generatePreview(requestFor(2));

    std::vector<std::string> tokens;
    for (size_t i = 0; i < TimetableService::kMaxPreviewsPerClass + 1; ++i) {
        tokens.push_back(service.generatePreview(requestFor(1)).token);
    }

    EXPECT_FALSE(service.findPreview(tokens.front()).has_value());
    EXPECT_THROW(service.publish(tokens.front()), NotFoundError);
    for (size_t i = 1; i < tokens.size(); ++i) {
        EXPECT_TRUE(service.findPreview(tokens[i]).has_value());
    }
    // чужой класс не вытесняется
    EXPECT_TRUE(service.findPreview(other.token).has_value());
}

TEST_F(WorkflowTest, ExpiredPreviewIsDroppedOnNextInsert) {
    seedSixSubjectClass(store, 1, 1);
    seedSixSubjectClass(store, 2, 1, 10);
    TimetableService shortLived{store, std::chrono::seconds(0)};

    Preview stale = shortLived.generatePreview(requestFor(1));
    EXPECT_FALSE(shortLived.findPreview(stale.token).has_value());
    EXPECT_THROW(shortLived.publish(stale.token), NotFoundError);

    shortLived.generatePreview(requestFor(2));
    EXPECT_FALSE(shortLived.discardPreview(stale.token)); // уже удалено из реестра
    EXPECT_TRUE(store.publishedCells().empty());
}

TEST_F(WorkflowTest, WeeklyViewReadsPublishedGrids) {
    seedSixSubjectClass(store, 1, 2);
    seedSixSubjectClass(store, 2, 1, 10);

    service.publish(service.generatePreview(requestFor(1, "Основное")).token);
    service.publish(service.generatePreview(requestFor(2)).token);

    WeeklyView all = service.getWeeklyView(kYear, SessionType::Morning);
    EXPECT_EQ(all.totalCells, 3 * kSlotsPerWeek);
    ASSERT_EQ(all.grids.size(), 3u);
    EXPECT_EQ(all.grids[0].classId, 1);
    EXPECT_EQ(all.grids[0].section, "1");
    EXPECT_EQ(all.grids[0].name, "Основное");
    EXPECT_EQ(all.grids[2].classId, 2);
    const ScheduleCellView& first = all.grids[0].cells.front();
    EXPECT_EQ(first.day, 0);
    EXPECT_EQ(first.period, 1); // уроки в представлении с 1
    EXPECT_EQ(first.subjectName, "Предмет " + std::to_string(first.subjectId - 100));
    EXPECT_EQ(first.teacherName, "Учитель " + std::to_string(first.teacherId));

    WeeklyView oneClass = service.getWeeklyView(kYear, SessionType::Morning, 2);
    ASSERT_EQ(oneClass.grids.size(), 1u);
    EXPECT_EQ(oneClass.totalCells, kSlotsPerWeek);

    // учитель 3 ведёт по 5 уроков в обеих секциях класса 1
    WeeklyView teacher = service.getWeeklyView(kYear, SessionType::Morning, std::nullopt, 3);
    EXPECT_EQ(teacher.totalCells, 10);
    ASSERT_EQ(teacher.grids.size(), 2u);
    for (const ScheduleGridView& gv : teacher.grids) {
        for (const ScheduleCellView& c : gv.cells) EXPECT_EQ(c.teacherId, 3);
    }

    EXPECT_EQ(service.getWeeklyView(kYear, SessionType::Evening).totalCells, 0);
}
