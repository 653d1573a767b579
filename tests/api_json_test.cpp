#include <gtest/gtest.h>

#include <set>

#include <nlohmann/json.hpp>

#include "api_json.h"
#include "errors.h"
#include "jwt_utils.h"
#include "memory_store.h"
#include "test_helpers.h"

using nlohmann::json;

TEST(EnvelopeTest, OkAndErrorShapes) {
    json ok = makeOkEnvelope(json{{"count", 3}});
    EXPECT_TRUE(ok["ok"].get<bool>());
    EXPECT_EQ(ok["data"]["count"], 3);

    json err = makeErrorEnvelope("not_found", "нет такого класса");
    EXPECT_FALSE(err["ok"].get<bool>());
    EXPECT_EQ(err["error"]["code"], "not_found");
    EXPECT_EQ(err["error"]["message"], "нет такого класса");
    EXPECT_TRUE(err["error"]["details"].is_object());
}

TEST(EnvelopeTest, StatusPerErrorCode) {
    EXPECT_EQ(httpStatusForCode("feasibility_error"), 422);
    EXPECT_EQ(httpStatusForCode("malformed_availability"), 422);
    EXPECT_EQ(httpStatusForCode("name_conflict"), 409);
    EXPECT_EQ(httpStatusForCode("availability_conflict"), 409);
    EXPECT_EQ(httpStatusForCode("not_found"), 404);
    EXPECT_EQ(httpStatusForCode("bad_request"), 400);
    EXPECT_EQ(httpStatusForCode("unauthorized"), 401);
    EXPECT_EQ(httpStatusForCode("forbidden"), 403);
    EXPECT_EQ(httpStatusForCode("generation_error"), 500);
    EXPECT_EQ(httpStatusForCode("integrity_violation"), 500);
}

TEST(EnvelopeTest, FeasibilityErrorCarriesReport) {
    Obstruction o;
    o.kind      = ObstructionKind::InsufficientAvailability;
    o.classId   = 1;
    o.teacherId = 1;
    o.required  = 10;
    o.available = 8;
    o.shortfall = 2;
    o.message   = "мало свободных слотов";

    FeasibilityError error(FeasibilityReport{false, {o}});
    json env = errorToEnvelope(error);

    EXPECT_EQ(env["error"]["code"], "feasibility_error");
    const json& details = env["error"]["details"];
    EXPECT_FALSE(details["feasible"].get<bool>());
    ASSERT_EQ(details["obstructions"].size(), 1u);
    EXPECT_EQ(details["obstructions"][0]["kind"], "insufficient_availability");
    EXPECT_EQ(details["obstructions"][0]["shortfall"], 2);
    EXPECT_TRUE(details["obstructions"][0]["subjectId"].is_null());
}

TEST(EnvelopeTest, ConflictErrorsCarryDetails) {
    json name = errorToEnvelope(NameConflictError("duplicate_name", "имя занято"));
    EXPECT_EQ(name["error"]["code"], "name_conflict");
    EXPECT_EQ(name["error"]["details"]["reason"], "duplicate_name");

    AvailabilityConflictError busy({AvailabilityConflict{3, "Иванова", 1, 2}});
    json env = errorToEnvelope(busy);
    EXPECT_EQ(env["error"]["code"], "availability_conflict");
    ASSERT_EQ(env["error"]["details"]["conflicts"].size(), 1u);
    EXPECT_EQ(env["error"]["details"]["conflicts"][0]["teacherId"], 3);
    EXPECT_EQ(env["error"]["details"]["conflicts"][0]["period"], 2);

    json plain = errorToEnvelope(NotFoundError("нет"));
    EXPECT_TRUE(plain["error"]["details"].empty());
}

TEST(ConstraintJsonTest, LegacyNoConsecutiveMeansLimitOne) {
    Constraint c = constraintFromJson(json{{"id", 5}, {"type", "no_consecutive"}, {"subjectId", 101}});

    EXPECT_EQ(c.type, ConstraintType::MaxConsecutive);
    EXPECT_EQ(c.limit, 1);
    EXPECT_EQ(c.subjectId.value_or(0), 101);
    EXPECT_FALSE(c.teacherId.has_value());

    json back = constraintToJson(c);
    EXPECT_EQ(back["type"], "max_consecutive");
    EXPECT_TRUE(back["teacherId"].is_null());
}

TEST(ConstraintJsonTest, RejectsUnknownTypeAndNonIntegers) {
    EXPECT_THROW(constraintFromJson(json{{"type", "sometimes"}}), std::invalid_argument);
    EXPECT_THROW(constraintFromJson(json{{"type", "forbidden"}, {"day", "monday"}}), std::invalid_argument);
    EXPECT_THROW(constraintFromJson(json::array()), std::invalid_argument);
}

TEST(JwtTest, RoundTripAndWrongSecret) {
    std::string token = createJwt(42, "admin", "secret-a", 3600);

    std::optional<JwtPayload> payload = verifyJwt(token, "secret-a");
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(payload->userId, 42);
    EXPECT_EQ(payload->role, "admin");

    EXPECT_FALSE(verifyJwt(token, "secret-b").has_value());
    EXPECT_FALSE(verifyJwt("not.a.token", "secret-a").has_value());
}

TEST(JwtTest, ExpiredTokenIsRejected) {
    std::string token = createJwt(1, "admin", "s", -10);
    EXPECT_FALSE(verifyJwt(token, "s").has_value());
}

TEST(JwtTest, OpaqueTokensAreDistinct) {
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        std::string t = generateOpaqueToken(24);
        EXPECT_EQ(t.size(), 32u);
        EXPECT_EQ(t.find_first_of("+/="), std::string::npos);
        seen.insert(t);
    }
    EXPECT_EQ(seen.size(), 50u);
}

TEST(CatalogJsonTest, LoadsClassesTeachersAndConstraints) {
    json catalog = {
        {"classes", {{{"id", 1}, {"name", "7А"}, {"sectionCount", 2}, {"academicYearId", kYear}}}},
        {"subjects", {{{"id", 101}, {"classId", 1}, {"weeklyHours", 30}}}},
        {"teachers", {{{"id", 1}, {"name", "Иванова"}, {"allFree", true}},
                      {{"id", 2}, {"name", "Петров"}}}},
        {"assignments", {{{"teacherId", 1}, {"subjectId", 101}, {"classId", 1}}}},
        {"constraints", {{{"id", 7}, {"type", "forbidden"}, {"teacherId", 1}, {"day", 0}, {"period", 0},
                          {"sessionType", "evening"}}}}
    };

    std::unique_ptr<MemoryScheduleStore> store = MemoryScheduleStore::fromJson(catalog);

    GenerationInput input = store->loadGenerationInput(kYear, SessionType::Morning, 1);
    EXPECT_EQ(input.schoolClass.name, "7А");
    EXPECT_EQ(input.schoolClass.sectionCount, 2);
    EXPECT_EQ(input.subjects.size(), 1u);
    EXPECT_EQ(input.assignments.size(), 1u);
    EXPECT_TRUE(input.constraints.empty()); // ограничение только для вечерней смены

    EXPECT_EQ(store->loadConstraints(kYear, SessionType::Evening).size(), 1u);
    EXPECT_EQ(store->teacherAvailability(1), AvailabilityGrid::allFree());
    EXPECT_EQ(store->teacherAvailability(2).countInState(SlotState::Unavailable), kSlotsPerWeek);
    EXPECT_THROW(store->teacherAvailability(3), NotFoundError);

    EXPECT_THROW(MemoryScheduleStore::fromJson(json::array()), std::invalid_argument);
}

TEST(ViewJsonTest, WeeklyViewAndSectionPreview) {
    MemoryScheduleStore store;
    TimetableService service{store};
    seedSixSubjectClass(store, 1, 2);

    ScheduleRequest request{kYear, SessionType::Morning, 1, "Основное"};
    request.section = "2";
    Preview preview = service.generatePreview(request);

    json previewJson = previewToJson(preview);
    EXPECT_EQ(previewJson["section"], "2");
    ASSERT_EQ(previewJson["grids"].size(), 1u);
    EXPECT_EQ(previewJson["grids"][0]["section"], "2");
    EXPECT_EQ(previewJson["grids"][0]["name"], "");

    service.publish(preview.token);

    json view = weeklyViewToJson(service.getWeeklyView(kYear, SessionType::Morning, 1));
    EXPECT_EQ(view["sessionType"], "morning");
    EXPECT_EQ(view["classId"], 1);
    EXPECT_TRUE(view["teacherId"].is_null());
    EXPECT_EQ(view["totalCells"], kSlotsPerWeek);
    ASSERT_EQ(view["grids"].size(), 1u);
    EXPECT_EQ(view["grids"][0]["classId"], 1);
    EXPECT_EQ(view["grids"][0]["name"], "Основное");
    EXPECT_EQ(view["grids"][0]["cells"].size(), static_cast<size_t>(kSlotsPerWeek));
}
