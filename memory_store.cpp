#include "memory_store.h"

#include "api_json.h"
#include "errors.h"
#include "logger.h"

#include <algorithm>
#include <stdexcept>

using nlohmann::json;

// ==================== общие выборки по состоянию ====================

static bool sameKey(const PublishedCell& pc, const ScheduleKey& key) {
    return pc.academicYearId == key.academicYearId &&
           pc.sessionType == key.sessionType &&
           pc.cell.classId == key.classId &&
           pc.cell.section == key.section;
}

static TeacherAvailability* findTeacher(MemoryScheduleStore::State& state, int teacherId) {
    for (TeacherAvailability& t : state.teachers) {
        if (t.teacherId == teacherId) return &t;
    }
    return nullptr;
}

static std::vector<TeacherAvailability> selectTeachers(
    const MemoryScheduleStore::State& state,
    const std::vector<int>& teacherIds
) {
    std::vector<TeacherAvailability> result;
    for (int id : teacherIds) {
        for (const TeacherAvailability& t : state.teachers) {
            if (t.teacherId == id) {
                result.push_back(t);
                break;
            }
        }
    }
    return result;
}

static std::vector<Constraint> selectConstraints(
    const MemoryScheduleStore::State& state,
    int academicYearId,
    SessionType sessionType
) {
    std::vector<Constraint> result;
    for (const auto& sc : state.constraints) {
        if (sc.academicYearId && *sc.academicYearId != academicYearId) continue;
        if (sc.sessionType && *sc.sessionType != sessionType) continue;
        result.push_back(sc.constraint);
    }
    return result;
}

// ==================== транзакция ====================

class MemoryTransaction : public StoreTransaction {
public:
    explicit MemoryTransaction(MemoryScheduleStore& store)
        : store_(store), lock_(store.mutex_), working_(store.state_) {}

    ~MemoryTransaction() override {
        if (!committed_) {
            logDebug("MemoryTransaction: откат");
        }
    }

    std::vector<TeacherAvailability> lockTeachers(const std::vector<int>& teacherIds) override {
        return selectTeachers(working_, teacherIds);
    }

    bool isPublished(const ScheduleKey& key) override {
        return std::any_of(working_.published.begin(), working_.published.end(),
                           [&](const PublishedCell& pc) { return sameKey(pc, key); });
    }

    bool isNameTaken(int academicYearId, SessionType sessionType,
                     int classId, const std::string& name) override {
        for (const PublishedCell& pc : working_.published) {
            if (pc.academicYearId == academicYearId && pc.sessionType == sessionType &&
                pc.cell.classId != classId && pc.name == name) {
                return true;
            }
        }
        return false;
    }

    std::vector<ScheduleCell> findCells(const ScheduleKey& key) override {
        std::vector<ScheduleCell> result;
        for (const PublishedCell& pc : working_.published) {
            if (sameKey(pc, key)) result.push_back(pc.cell);
        }
        return result;
    }

    void insertCell(int academicYearId, SessionType sessionType,
                    const ScheduleCell& cell, const std::string& name) override {
        // то же, что уникальный индекс в schedule_cell
        for (const PublishedCell& pc : working_.published) {
            if (pc.academicYearId == academicYearId && pc.sessionType == sessionType &&
                pc.cell.classId == cell.classId && pc.cell.section == cell.section &&
                pc.cell.day == cell.day && pc.cell.period == cell.period) {
                throw NameConflictError("already_published",
                                        "Ячейка " + dayName(cell.day) + "/" + std::to_string(cell.period + 1) +
                                        " секции " + cell.section + " уже опубликована");
            }
        }
        working_.published.push_back(PublishedCell{academicYearId, sessionType, cell, name});
    }

    int deleteCells(const ScheduleKey& key) override {
        auto& cells = working_.published;
        auto it = std::remove_if(cells.begin(), cells.end(),
                                 [&](const PublishedCell& pc) { return sameKey(pc, key); });
        int removed = static_cast<int>(std::distance(it, cells.end()));
        cells.erase(it, cells.end());
        return removed;
    }

    void saveAvailability(int teacherId, const AvailabilityGrid& grid) override {
        TeacherAvailability* t = findTeacher(working_, teacherId);
        if (!t) {
            throw NotFoundError("Учитель id=" + std::to_string(teacherId) + " не найден");
        }
        t->grid = grid;
    }

    void commit() override {
        if (committed_) {
            throw std::logic_error("Транзакция уже зафиксирована");
        }
        store_.state_ = std::move(working_);
        committed_ = true;
    }

private:
    MemoryScheduleStore& store_;
    std::unique_lock<std::mutex> lock_;
    MemoryScheduleStore::State working_;
    bool committed_ = false;
};

// ==================== MemoryScheduleStore ====================

void MemoryScheduleStore::addClass(const SchoolClass& schoolClass, int academicYearId, SessionType sessionType) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.classes.push_back(StoredClass{schoolClass, academicYearId, sessionType});
}

void MemoryScheduleStore::addSubject(const Subject& subject) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.subjects.push_back(subject);
}

void MemoryScheduleStore::addTeacher(const TeacherAvailability& teacher) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.teachers.push_back(teacher);
}

void MemoryScheduleStore::addAssignment(const TeacherAssignment& assignment) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.assignments.push_back(assignment);
}

void MemoryScheduleStore::addConstraint(const Constraint& constraint,
                                        const std::optional<int>& academicYearId,
                                        const std::optional<SessionType>& sessionType) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.constraints.push_back(StoredConstraint{constraint, academicYearId, sessionType});
}

void MemoryScheduleStore::addPublishedCell(const PublishedCell& cell) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.published.push_back(cell);
}

void MemoryScheduleStore::setTeacherAvailability(int teacherId, const AvailabilityGrid& grid) {
    std::lock_guard<std::mutex> lock(mutex_);
    TeacherAvailability* t = findTeacher(state_, teacherId);
    if (!t) {
        throw NotFoundError("Учитель id=" + std::to_string(teacherId) + " не найден");
    }
    t->grid = grid;
}

AvailabilityGrid MemoryScheduleStore::teacherAvailability(int teacherId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const TeacherAvailability& t : state_.teachers) {
        if (t.teacherId == teacherId) return t.grid;
    }
    throw NotFoundError("Учитель id=" + std::to_string(teacherId) + " не найден");
}

std::vector<PublishedCell> MemoryScheduleStore::publishedCells() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.published;
}

GenerationInput MemoryScheduleStore::loadGenerationInput(int academicYearId, SessionType sessionType, int classId) {
    std::lock_guard<std::mutex> lock(mutex_);

    const StoredClass* found = nullptr;
    for (const StoredClass& sc : state_.classes) {
        if (sc.schoolClass.id == classId && sc.academicYearId == academicYearId &&
            sc.sessionType == sessionType) {
            found = &sc;
            break;
        }
    }
    if (!found) {
        throw NotFoundError("Класс id=" + std::to_string(classId) + " не найден для года " +
                            std::to_string(academicYearId) + ", смена " + sessionTypeToString(sessionType));
    }

    GenerationInput input;
    input.academicYearId = academicYearId;
    input.sessionType    = sessionType;
    input.schoolClass    = found->schoolClass;

    for (const Subject& s : state_.subjects) {
        if (s.classId == classId) input.subjects.push_back(s);
    }

    std::vector<int> teacherIds;
    for (const TeacherAssignment& a : state_.assignments) {
        if (a.classId != classId) continue;
        input.assignments.push_back(a);
        if (std::find(teacherIds.begin(), teacherIds.end(), a.teacherId) == teacherIds.end()) {
            teacherIds.push_back(a.teacherId);
        }
    }

    input.teachers    = selectTeachers(state_, teacherIds);
    input.constraints = selectConstraints(state_, academicYearId, sessionType);
    return input;
}

std::vector<PublishedCell> MemoryScheduleStore::loadPublishedCells(
    const std::optional<int>& academicYearId,
    const std::optional<SessionType>& sessionType
) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PublishedCell> result;
    for (const PublishedCell& pc : state_.published) {
        if (academicYearId && pc.academicYearId != *academicYearId) continue;
        if (sessionType && pc.sessionType != *sessionType) continue;
        result.push_back(pc);
    }
    return result;
}

std::vector<Constraint> MemoryScheduleStore::loadConstraints(int academicYearId, SessionType sessionType) {
    std::lock_guard<std::mutex> lock(mutex_);
    return selectConstraints(state_, academicYearId, sessionType);
}

std::vector<TeacherAvailability> MemoryScheduleStore::loadTeachers(const std::vector<int>& teacherIds) {
    std::lock_guard<std::mutex> lock(mutex_);
    return selectTeachers(state_, teacherIds);
}

std::vector<Subject> MemoryScheduleStore::loadSubjects(const std::vector<int>& subjectIds) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Subject> result;
    for (const Subject& s : state_.subjects) {
        if (std::find(subjectIds.begin(), subjectIds.end(), s.id) != subjectIds.end()) {
            result.push_back(s);
        }
    }
    return result;
}

std::unique_ptr<StoreTransaction> MemoryScheduleStore::begin() {
    return std::make_unique<MemoryTransaction>(*this);
}

// ==================== загрузка каталога из JSON ====================

static std::optional<std::string> optionalSection(const json& j) {
    if (!j.contains("section") || j["section"].is_null()) return std::nullopt;
    return j["section"].get<std::string>();
}

std::unique_ptr<MemoryScheduleStore> MemoryScheduleStore::fromJson(const json& catalog) {
    if (!catalog.is_object()) {
        throw std::invalid_argument("Каталог должен быть JSON-объектом");
    }

    auto store = std::make_unique<MemoryScheduleStore>();
    const json empty = json::array();

    for (const auto& jc : catalog.value("classes", empty)) {
        SchoolClass c;
        c.id           = jc.at("id").get<int>();
        c.name         = jc.value("name", std::string("Класс"));
        c.sectionCount = jc.value("sectionCount", 1);
        store->addClass(c, jc.at("academicYearId").get<int>(),
                        sessionTypeFromString(jc.value("sessionType", std::string("morning"))));
    }

    for (const auto& js : catalog.value("subjects", empty)) {
        Subject s;
        s.id          = js.at("id").get<int>();
        s.classId     = js.at("classId").get<int>();
        s.name        = js.value("name", std::string("Предмет"));
        s.weeklyHours = js.value("weeklyHours", 0);
        store->addSubject(s);
    }

    for (const auto& jt : catalog.value("teachers", empty)) {
        TeacherAvailability t;
        t.teacherId   = jt.at("id").get<int>();
        t.teacherName = jt.value("name", std::string("Учитель"));
        if (jt.value("allFree", false)) {
            t.grid = AvailabilityGrid::allFree();
        } else {
            t.grid = parseAvailabilityJson(jt.contains("availability") ? jt["availability"] : json());
        }
        store->addTeacher(t);
    }

    for (const auto& ja : catalog.value("assignments", empty)) {
        TeacherAssignment a;
        a.teacherId = ja.at("teacherId").get<int>();
        a.subjectId = ja.at("subjectId").get<int>();
        a.classId   = ja.at("classId").get<int>();
        a.section   = optionalSection(ja);
        store->addAssignment(a);
    }

    for (const auto& jc : catalog.value("constraints", empty)) {
        std::optional<int> year;
        if (jc.contains("academicYearId") && !jc["academicYearId"].is_null()) {
            year = jc["academicYearId"].get<int>();
        }
        std::optional<SessionType> session;
        std::string sessionStr = jc.value("sessionType", std::string("both"));
        if (sessionStr != "both") session = sessionTypeFromString(sessionStr);

        store->addConstraint(constraintFromJson(jc), year, session);
    }

    for (const auto& jp : catalog.value("published", empty)) {
        PublishedCell pc;
        pc.academicYearId = jp.at("academicYearId").get<int>();
        pc.sessionType    = sessionTypeFromString(jp.at("sessionType").get<std::string>());
        pc.cell.classId   = jp.at("classId").get<int>();
        pc.cell.section   = jp.at("section").get<std::string>();
        pc.cell.day       = jp.at("day").get<int>();
        pc.cell.period    = jp.at("period").get<int>();
        pc.cell.subjectId = jp.at("subjectId").get<int>();
        pc.cell.teacherId = jp.at("teacherId").get<int>();
        pc.name           = jp.value("name", std::string(""));
        store->addPublishedCell(pc);
    }

    logInfo("Каталог загружен в память");
    return store;
}
