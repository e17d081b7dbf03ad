#include <gtest/gtest.h>
#include "planfix/saved_plan.hpp"
#include <clocale>
#include <stdexcept>
#include <string>

class SavedPlanTest : public ::testing::Test {
protected:
    planfix::SavedPlan plan;

    void SetUp() override {
        plan.id = "2025-03-14T09:26:53.589";
        plan.name = "Building \"C\" level 2";
        plan.file_path = "/data/plans/c2.pdf";
        plan.calibration = {{
            {{32.0853123, 34.7818064}, {120.5, 88.25}},
            {{32.0861, 34.7829}, {940.0, 75.0}},
            {{32.0849, 34.7832}, {1010.125, 640.0}}
        }};
        plan.last_opened = "2025-03-15T18:02:11.000";
    }
};

TEST_F(SavedPlanTest, WritesLegacyFieldNames) {
    std::string json = planfix::to_json(plan);

    EXPECT_NE(json.find("\"filePath\":\"/data/plans/c2.pdf\""), std::string::npos);
    EXPECT_NE(json.find("\"gps1_x\":32.0853123"), std::string::npos);
    EXPECT_NE(json.find("\"gps1_y\":34.7818064"), std::string::npos);
    EXPECT_NE(json.find("\"pdf3_x\":1010.125"), std::string::npos);
    EXPECT_NE(json.find("\"lastOpened\":\"2025-03-15T18:02:11.000\""), std::string::npos);
    EXPECT_NE(json.find("\\\"C\\\""), std::string::npos);
}

TEST_F(SavedPlanTest, ReadsBackWrittenPlan) {
    auto restored = planfix::saved_plan_from_json(planfix::to_json(plan));

    EXPECT_EQ(restored.id, plan.id);
    EXPECT_EQ(restored.name, plan.name);
    EXPECT_EQ(restored.file_path, plan.file_path);
    EXPECT_EQ(restored.last_opened, plan.last_opened);
    for (size_t i = 0; i < 3; i++) {
        EXPECT_EQ(restored.calibration[i].geo.lat, plan.calibration[i].geo.lat);
        EXPECT_EQ(restored.calibration[i].geo.lon, plan.calibration[i].geo.lon);
        EXPECT_EQ(restored.calibration[i].pixel.x, plan.calibration[i].pixel.x);
        EXPECT_EQ(restored.calibration[i].pixel.y, plan.calibration[i].pixel.y);
    }
}

TEST_F(SavedPlanTest, TwoPointFileDefaultsThirdPoint) {
    const std::string json = R"({
        "id": "old",
        "name": "Warehouse",
        "filePath": "/data/warehouse.png",
        "gps1_x": 1.5, "gps1_y": 2.5,
        "pdf1_x": 10, "pdf1_y": 20,
        "gps2_x": 1.6, "gps2_y": 2.6,
        "pdf2_x": 110, "pdf2_y": 120,
        "lastOpened": "2024-11-02T08:00:00.000"
    })";
    auto restored = planfix::saved_plan_from_json(json);

    EXPECT_EQ(restored.name, "Warehouse");
    EXPECT_EQ(restored.calibration[1].pixel.y, 120.0);
    EXPECT_EQ(restored.calibration[2].geo.lat, 0.0);
    EXPECT_EQ(restored.calibration[2].geo.lon, 0.0);
    EXPECT_EQ(restored.calibration[2].pixel.x, 0.0);
    EXPECT_EQ(restored.calibration[2].pixel.y, 0.0);
}

TEST_F(SavedPlanTest, NullThirdPointReadsAsZero) {
    const std::string json = R"({"id":"a","name":"n","filePath":"f",
        "gps1_x":1,"gps1_y":2,"pdf1_x":3,"pdf1_y":4,
        "gps2_x":5,"gps2_y":6,"pdf2_x":7,"pdf2_y":8,
        "gps3_x":null,"gps3_y":null,"pdf3_x":null,"pdf3_y":null,
        "lastOpened":"2024-01-01T00:00:00.000"})";
    auto restored = planfix::saved_plan_from_json(json);
    EXPECT_EQ(restored.calibration[2].pixel.x, 0.0);
}

TEST_F(SavedPlanTest, MissingRequiredFieldThrows) {
    const std::string json = R"({"id":"a","name":"n","filePath":"f",
        "gps1_x":1,"gps1_y":2,"pdf1_x":3,"pdf1_y":4,
        "lastOpened":"2024-01-01T00:00:00.000"})";
    EXPECT_THROW(planfix::saved_plan_from_json(json), std::runtime_error);
}

TEST_F(SavedPlanTest, KeyInsideValueIsNotAField) {
    plan.name = "id";
    plan.id = "real-id";
    auto restored = planfix::saved_plan_from_json(planfix::to_json(plan));
    EXPECT_EQ(restored.id, "real-id");
    EXPECT_EQ(restored.name, "id");
}

TEST_F(SavedPlanTest, ListOfPlans) {
    planfix::SavedPlan other = plan;
    other.id = "second";
    other.name = "Braces {in} [name]";

    auto restored = planfix::saved_plans_from_json(planfix::to_json(std::vector<planfix::SavedPlan>{plan, other}));
    ASSERT_EQ(restored.size(), 2u);
    EXPECT_EQ(restored[0].id, plan.id);
    EXPECT_EQ(restored[1].name, "Braces {in} [name]");
}

TEST_F(SavedPlanTest, EmptyList) {
    EXPECT_TRUE(planfix::saved_plans_from_json("[]").empty());
    EXPECT_EQ(planfix::to_json(std::vector<planfix::SavedPlan>{}), "[]");
}

TEST_F(SavedPlanTest, MalformedListThrows) {
    EXPECT_THROW(planfix::saved_plans_from_json("{\"id\":\"x\"}"), std::runtime_error);
    EXPECT_THROW(planfix::saved_plans_from_json("[{\"id\":\"x\""), std::runtime_error);
}

TEST_F(SavedPlanTest, NumberWithTrailingGarbageThrows) {
    std::string json = planfix::to_json(plan);
    auto pos = json.find("\"gps1_x\":32.0853123");
    ASSERT_NE(pos, std::string::npos);
    json.insert(pos + std::string("\"gps1_x\":32.0853123").size(), "abc");
    EXPECT_THROW(planfix::saved_plan_from_json(json), std::runtime_error);
}

TEST_F(SavedPlanTest, NumbersIgnoreCommaDecimalLocale) {
    const char* previous = std::setlocale(LC_NUMERIC, nullptr);
    std::string saved = previous ? previous : "C";
    if (!std::setlocale(LC_NUMERIC, "de_DE.UTF-8") && !std::setlocale(LC_NUMERIC, "de_DE")) {
        GTEST_SKIP() << "no comma-decimal locale installed";
    }

    auto restored = planfix::saved_plan_from_json(planfix::to_json(plan));
    std::setlocale(LC_NUMERIC, saved.c_str());

    EXPECT_EQ(restored.calibration[0].geo.lat, 32.0853123);
    EXPECT_EQ(restored.calibration[2].pixel.x, 1010.125);
}

TEST_F(SavedPlanTest, EscapedSurrogatePairDecodesToOneCodePoint) {
    const std::string json = R"({"id":"a","name":"Caf\u00e9 \ud83d\ude00","filePath":"f",
        "gps1_x":1,"gps1_y":2,"pdf1_x":3,"pdf1_y":4,
        "gps2_x":5,"gps2_y":6,"pdf2_x":7,"pdf2_y":8,
        "lastOpened":"2024-01-01T00:00:00.000"})";
    auto restored = planfix::saved_plan_from_json(json);
    EXPECT_EQ(restored.name, "Caf\xC3\xA9 \xF0\x9F\x98\x80");
}

TEST_F(SavedPlanTest, UnpairedSurrogateThrows) {
    const std::string tail = R"(","filePath":"f",
        "gps1_x":1,"gps1_y":2,"pdf1_x":3,"pdf1_y":4,
        "gps2_x":5,"gps2_y":6,"pdf2_x":7,"pdf2_y":8,
        "lastOpened":"2024-01-01T00:00:00.000"})";
    EXPECT_THROW(planfix::saved_plan_from_json(R"({"id":"a","name":"x\ud83d)" + tail),
                 std::runtime_error);
    EXPECT_THROW(planfix::saved_plan_from_json(R"({"id":"a","name":"x\ude00)" + tail),
                 std::runtime_error);
    EXPECT_THROW(planfix::saved_plan_from_json(R"({"id":"a","name":"x\ud83dA)" + tail),
                 std::runtime_error);
}
