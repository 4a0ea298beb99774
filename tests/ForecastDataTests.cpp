#include "TestSupport.h"

#include "forecast/CityForecastSet.h"
#include "forecast/ForecastDateResolver.h"
#include "forecast/GeoSorter.h"
#include "ingest/ForecastXmlParser.h"
#include "model/ForecastRecord.h"
#include "model/WeatherCodeMapping.h"
#include "util/Error.h"
#include "util/TimeUtil.h"

#include <algorithm>
#include <fstream>
#include <string>
#include <vector>

namespace {

struct CitySeed {
    const char* name;
    double latitude;
};

// Feed order, not geographic order.
const CitySeed kFeedCities[] = {
    { "Zefat", 33.00 },       { "Qazrin", 33.05 },     { "Bet Shean", 32.45 },  { "Tel Aviv - Yafo", 32.05 },
    { "Elat", 29.55 },        { "Haifa", 32.40 },      { "Jerusalem", 31.75 },  { "Beer Sheva", 31.25 },
    { "Tiberias", 32.35 },    { "Lod", 31.90 },        { "Mizpe Ramon", 30.60 }, { "Nazareth", 32.30 },
    { "Ashdod", 31.80 },      { "Afula", 32.25 },      { "En Gedi", 31.45 },
};

const char* kNorthToSouth[] = {
    "Qazrin", "Zefat", "Bet Shean", "Haifa", "Tiberias", "Nazareth", "Afula", "Tel Aviv - Yafo",
    "Lod", "Ashdod", "Jerusalem", "En Gedi", "Beer Sheva", "Mizpe Ramon", "Elat",
};

ForecastRecord MakeRecord(const std::string& name, double latitude, const std::string& date) {
    ForecastRecord record;
    record.city_id = name;
    record.name_eng = name;
    record.name_heb = name;
    record.latitude = latitude;
    record.longitude = 35.0;
    record.date = date;
    record.min_temp_c = 18;
    record.max_temp_c = 29;
    record.weather_code = 1250;
    return record;
}

std::vector<ForecastRecord> FifteenCities(const std::string& date) {
    std::vector<ForecastRecord> records;
    for (const auto& city : kFeedCities) {
        records.push_back(MakeRecord(city.name, city.latitude, date));
    }
    return records;
}

} // namespace

static void TestTimeUtilDates() {
    int y = 0, m = 0, d = 0;
    EXPECT_TRUE(TimeUtil::ParseDate("2025-10-15", &y, &m, &d));
    EXPECT_EQ(y, 2025);
    EXPECT_EQ(m, 10);
    EXPECT_EQ(d, 15);

    EXPECT_TRUE(TimeUtil::IsValidDate("2024-02-29"));
    EXPECT_FALSE(TimeUtil::IsValidDate("2025-02-29"));
    EXPECT_FALSE(TimeUtil::IsValidDate("2025-13-01"));
    EXPECT_FALSE(TimeUtil::IsValidDate("2025-1-01"));
    EXPECT_FALSE(TimeUtil::IsValidDate("15/10/2025"));
    EXPECT_FALSE(TimeUtil::IsValidDate(""));

    EXPECT_EQ(TimeUtil::FormatDisplayDate("2025-10-15"), std::string("15/10/2025"));
    EXPECT_EQ(TimeUtil::AddDays("2025-12-31", 1), std::string("2026-01-01"));
    EXPECT_EQ(TimeUtil::AddDays("2024-03-01", -1), std::string("2024-02-29"));
    EXPECT_EQ(TimeUtil::DateSeed("2025-10-15"), 20251015u);
    EXPECT_EQ(TimeUtil::DateSeed("bogus"), 0u);
    EXPECT_EQ(TimeUtil::DaysInMonth(2023, 2), 28);
}

static void TestTemperatureRange() {
    ForecastRecord record = MakeRecord("Haifa", 32.4, "2025-10-15");
    record.min_temp_c = -2;
    record.max_temp_c = 7;
    EXPECT_EQ(FormatTemperatureRange(record), std::string("-2-7\xC2\xB0" "C"));
}

static void TestWeatherCodeMapping() {
    WeatherCodeMapping mapping;
    Error error;
    ASSERT_TRUE(WeatherCodeMapping::Create({ { 1250, "1250_clear" }, { 1220, "1220_partly_cloudy" } }, "1250_clear",
                                           &mapping, &error));
    EXPECT_EQ(mapping.Resolve(1220), std::string("1220_partly_cloudy"));
    EXPECT_EQ(mapping.Resolve(9999), std::string("1250_clear"));
    EXPECT_TRUE(mapping.IsMapped(1220));
    EXPECT_FALSE(mapping.IsMapped(9999));
    EXPECT_EQ(mapping.AssetIds().size(), 2u);

    WeatherCodeMapping no_fallback;
    Error missing;
    EXPECT_FALSE(WeatherCodeMapping::Create({ { 1250, "1250_clear" } }, "", &no_fallback, &missing));
    EXPECT_TRUE(missing.code == ErrorCode::InvalidInput);

    WeatherCodeMapping loaded;
    Error json_error;
    EXPECT_TRUE(WeatherCodeMapping::LoadFromJson(
        R"({ "fallback": "1250_clear", "codes": { "1310": "1310_mostly_clear", "1580": "1580_very_hot" } })",
        &loaded, &json_error));
    EXPECT_EQ(loaded.Resolve(1580), std::string("1580_very_hot"));
    EXPECT_EQ(loaded.Resolve(9999), std::string("1250_clear"));

    Error bad_key;
    EXPECT_FALSE(WeatherCodeMapping::LoadFromJson(R"({ "fallback": "x", "codes": { "abc": "y" } })", &loaded, &bad_key));
    Error no_table;
    EXPECT_FALSE(WeatherCodeMapping::LoadFromJson(R"({ "codes": { "1250": "1250_clear" } })", &loaded, &no_table));
}

static void TestSortNorthToSouth() {
    std::vector<ForecastRecord> sorted = SortNorthToSouth(FifteenCities("2025-10-15"));
    ASSERT_TRUE(sorted.size() == 15u);
    for (size_t i = 0; i < sorted.size(); ++i) {
        EXPECT_EQ(sorted[i].name_eng, std::string(kNorthToSouth[i]));
    }
    EXPECT_TRUE(IsSortedNorthToSouth(sorted));

    std::vector<ForecastRecord> again = SortNorthToSouth(sorted);
    for (size_t i = 0; i < sorted.size(); ++i) {
        EXPECT_EQ(again[i].name_eng, sorted[i].name_eng);
    }

    // Equal latitudes keep feed order.
    std::vector<ForecastRecord> ties = {
        MakeRecord("B", 31.0, "2025-10-15"),
        MakeRecord("A", 32.0, "2025-10-15"),
        MakeRecord("C", 31.0, "2025-10-15"),
    };
    std::vector<ForecastRecord> tied = SortNorthToSouth(ties);
    EXPECT_EQ(tied[0].name_eng, std::string("A"));
    EXPECT_EQ(tied[1].name_eng, std::string("B"));
    EXPECT_EQ(tied[2].name_eng, std::string("C"));
}

static void TestCityForecastSetDropsDuplicates() {
    std::vector<ForecastRecord> records = {
        MakeRecord("Haifa", 32.40, "2025-10-15"),
        MakeRecord("Elat", 29.55, "2025-10-15"),
        MakeRecord("Qazrin", 33.05, "2025-10-15"),
    };
    ForecastRecord duplicate = MakeRecord("Haifa", 10.0, "2025-10-15");
    duplicate.max_temp_c = 99;
    records.push_back(duplicate);

    std::vector<ValidationWarning> warnings;
    CityForecastSet set = CityForecastSet::Build("2025-10-15", records, &warnings);
    ASSERT_TRUE(set.Size() == 3u);
    EXPECT_EQ(set.Records()[0].name_eng, std::string("Qazrin"));
    EXPECT_EQ(set.Records()[1].name_eng, std::string("Haifa"));
    EXPECT_EQ(set.Records()[1].max_temp_c, 29);
    EXPECT_EQ(set.Records()[2].name_eng, std::string("Elat"));
    ASSERT_TRUE(warnings.size() == 1u);
    EXPECT_TRUE(warnings[0].kind == WarningKind::DuplicateCity);
}

static void TestResolverExactDate() {
    ForecastDataset dataset;
    dataset["2025-10-15"] = FifteenCities("2025-10-15");
    dataset["2025-10-16"] = FifteenCities("2025-10-16");

    ForecastDateResolver resolver(15);
    ResolveResult result;
    Error error;
    ASSERT_TRUE(resolver.Resolve(dataset, "2025-10-15", &result, &error));
    EXPECT_EQ(result.effective_date, std::string("2025-10-15"));
    EXPECT_FALSE(result.used_fallback);
    EXPECT_EQ(result.records.size(), 15u);
    EXPECT_TRUE(result.warnings.empty());
}

static void TestResolverSkipsToNextDate() {
    ForecastDataset dataset;
    dataset["2025-10-14"] = FifteenCities("2025-10-14");
    dataset["2025-10-15"] = {};
    dataset["2025-10-16"] = FifteenCities("2025-10-16");
    dataset["2025-10-17"] = FifteenCities("2025-10-17");

    ForecastDateResolver resolver(15);
    ResolveResult result;
    Error error;
    ASSERT_TRUE(resolver.Resolve(dataset, "2025-10-15", &result, &error));
    EXPECT_EQ(result.requested_date, std::string("2025-10-15"));
    EXPECT_EQ(result.effective_date, std::string("2025-10-16"));
    EXPECT_TRUE(result.used_fallback);
    EXPECT_EQ(result.records.size(), 15u);
    EXPECT_TRUE(result.warnings.empty());

    // A requested date absent from the dataset behaves the same way.
    ResolveResult missing;
    ASSERT_TRUE(resolver.Resolve(dataset, "2025-10-01", &missing, &error));
    EXPECT_EQ(missing.effective_date, std::string("2025-10-14"));
}

static void TestResolverNoData() {
    ForecastDataset dataset;
    dataset["2025-10-15"] = {};
    dataset["2025-10-16"] = {};

    ForecastDateResolver resolver(15);
    ResolveResult result;
    Error error;
    EXPECT_FALSE(resolver.Resolve(dataset, "2025-10-15", &result, &error));
    EXPECT_TRUE(error.code == ErrorCode::DataUnavailable);

    // Only earlier dates have data: nothing on or after the target.
    ForecastDataset stale;
    stale["2025-10-10"] = FifteenCities("2025-10-10");
    Error stale_error;
    EXPECT_FALSE(resolver.Resolve(stale, "2025-10-15", &result, &stale_error));
    EXPECT_TRUE(stale_error.code == ErrorCode::DataUnavailable);
}

static void TestResolverCountWarning() {
    ForecastDataset dataset;
    std::vector<ForecastRecord> records = FifteenCities("2025-10-15");
    records.resize(12);
    dataset["2025-10-15"] = records;

    ForecastDateResolver resolver(15);
    ResolveResult result;
    Error error;
    ASSERT_TRUE(resolver.Resolve(dataset, "2025-10-15", &result, &error));
    ASSERT_TRUE(result.warnings.size() == 1u);
    EXPECT_TRUE(result.warnings[0].kind == WarningKind::CityCountMismatch);
    EXPECT_EQ(result.warnings[0].expected, 15u);
    EXPECT_EQ(result.warnings[0].actual, 12u);
    EXPECT_EQ(result.records.size(), 12u);
}

static void TestResolverRejectsBadDate() {
    ForecastDataset dataset;
    dataset["2025-10-15"] = FifteenCities("2025-10-15");
    ForecastDateResolver resolver(15);
    ResolveResult result;
    Error error;
    EXPECT_FALSE(resolver.Resolve(dataset, "15/10/2025", &result, &error));
    EXPECT_TRUE(error.code == ErrorCode::InvalidInput);

    std::vector<std::string> dates = AvailableDates(dataset);
    ASSERT_TRUE(dates.size() == 1u);
    EXPECT_EQ(dates[0], std::string("2025-10-15"));
}

static const char* kFeedXml = R"(<?xml version="1.0" encoding="UTF-8"?>
<LocationForecasts>
  <Identification>
    <IssueDateTime>Wed Oct 15 06:00:00 IDT 2025</IssueDateTime>
  </Identification>
  <Location>
    <LocationMetaData>
      <LocationId>520</LocationId>
      <LocationNameEng>Elat</LocationNameEng>
      <LocationNameHeb>אילת</LocationNameHeb>
      <DisplayLat>29.55</DisplayLat>
      <DisplayLon>34.95</DisplayLon>
    </LocationMetaData>
    <LocationData>
      <TimeUnitData>
        <Date>2025-10-15</Date>
        <Element><ElementName>Maximum temperature</ElementName><ElementValue>34</ElementValue></Element>
        <Element><ElementName>Minimum temperature</ElementName><ElementValue>24</ElementValue></Element>
        <Element><ElementName>Weather code</ElementName><ElementValue>1250</ElementValue></Element>
        <Element><ElementName>Maximum relative humidity</ElementName><ElementValue>40</ElementValue></Element>
        <Element><ElementName>Minimum relative humidity</ElementName><ElementValue>20</ElementValue></Element>
        <Element><ElementName>Wind direction and speed</ElementName><ElementValue>315-045/10-25</ElementValue></Element>
      </TimeUnitData>
      <TimeUnitData>
        <Date>2025-10-16</Date>
        <Element><ElementName>Maximum temperature</ElementName><ElementValue>33</ElementValue></Element>
        <Element><ElementName>Minimum temperature</ElementName><ElementValue>23</ElementValue></Element>
      </TimeUnitData>
    </LocationData>
  </Location>
  <Location>
    <LocationMetaData>
      <LocationNameEng>Zefat</LocationNameEng>
      <LocationNameHeb>צפת</LocationNameHeb>
      <DisplayLat>33.00</DisplayLat>
      <DisplayLon>35.50</DisplayLon>
    </LocationMetaData>
    <LocationData>
      <TimeUnitData>
        <Date>2025-10-15</Date>
        <Element><ElementName>Maximum temperature</ElementName><ElementValue>25</ElementValue></Element>
        <Element><ElementName>Minimum temperature</ElementName><ElementValue>15</ElementValue></Element>
        <Element><ElementName>Weather code</ElementName><ElementValue>1220</ElementValue></Element>
      </TimeUnitData>
      <TimeUnitData>
        <Date>2025-10-16</Date>
        <Element><ElementName>Maximum temperature</ElementName><ElementValue>24</ElementValue></Element>
        <Element><ElementName>Minimum temperature</ElementName><ElementValue>14</ElementValue></Element>
        <Element><ElementName>Weather code</ElementName><ElementValue>1310</ElementValue></Element>
      </TimeUnitData>
    </LocationData>
  </Location>
</LocationForecasts>
)";

static void TestXmlParserGroupsByDate() {
    ForecastXmlParser parser;
    ParsedFeed feed;
    Error error;
    ASSERT_TRUE(parser.ParseMemory(kFeedXml, &feed, &error));
    EXPECT_EQ(feed.issue_datetime, std::string("Wed Oct 15 06:00:00 IDT 2025"));
    EXPECT_EQ(feed.location_count, 2u);
    EXPECT_EQ(feed.skipped_records, 1u);
    ASSERT_TRUE(feed.available_dates.size() == 2u);
    EXPECT_EQ(feed.available_dates[0], std::string("2025-10-15"));
    EXPECT_EQ(feed.available_dates[1], std::string("2025-10-16"));

    const auto& day1 = feed.dataset["2025-10-15"];
    ASSERT_TRUE(day1.size() == 2u);
    EXPECT_EQ(day1[0].city_id, std::string("520"));
    EXPECT_EQ(day1[0].name_heb, std::string("אילת"));
    EXPECT_EQ(day1[0].max_temp_c, 34);
    EXPECT_EQ(day1[0].weather_code, 1250);
    EXPECT_TRUE(day1[0].has_humidity);
    EXPECT_EQ(day1[0].min_humidity, 20);
    EXPECT_EQ(day1[0].wind, std::string("315-045/10-25"));
    EXPECT_EQ(day1[1].city_id, std::string("Zefat"));
    EXPECT_FALSE(day1[1].has_humidity);
    EXPECT_NEAR(day1[1].latitude, 33.0, 1e-9);

    // Elat's second day has no weather code and is skipped.
    const auto& day2 = feed.dataset["2025-10-16"];
    ASSERT_TRUE(day2.size() == 1u);
    EXPECT_EQ(day2[0].name_eng, std::string("Zefat"));
}

static void TestXmlParserDecodesHebrewCodepage() {
    std::string xml =
        "<?xml version=\"1.0\" encoding=\"ISO-8859-8\"?>"
        "<LocationForecasts><Location><LocationMetaData>"
        "<LocationNameEng>Zefat</LocationNameEng>"
        "<LocationNameHeb>\xF6\xF4\xFA</LocationNameHeb>"
        "<DisplayLat>33.0</DisplayLat><DisplayLon>35.5</DisplayLon>"
        "</LocationMetaData><LocationData><TimeUnitData><Date>2025-10-15</Date>"
        "<Element><ElementName>Maximum temperature</ElementName><ElementValue>25</ElementValue></Element>"
        "<Element><ElementName>Minimum temperature</ElementName><ElementValue>15</ElementValue></Element>"
        "<Element><ElementName>Weather code</ElementName><ElementValue>1250</ElementValue></Element>"
        "</TimeUnitData></LocationData></Location></LocationForecasts>";

    ForecastXmlParser parser;
    ParsedFeed feed;
    Error error;
    ASSERT_TRUE(parser.ParseMemory(xml, &feed, &error));
    ASSERT_TRUE(feed.dataset["2025-10-15"].size() == 1u);
    EXPECT_EQ(feed.dataset["2025-10-15"][0].name_heb, std::string("צפת"));
}

static void TestXmlParserFailures() {
    ForecastXmlParser parser;
    ParsedFeed feed;
    Error error;
    EXPECT_FALSE(parser.ParseMemory("<LocationForecasts><Location>", &feed, &error));
    EXPECT_TRUE(error.code == ErrorCode::ParseFailure);

    Error empty;
    EXPECT_FALSE(parser.ParseMemory("<LocationForecasts/>", &feed, &empty));
    EXPECT_TRUE(empty.code == ErrorCode::ParseFailure);

    Error missing_file;
    EXPECT_FALSE(parser.ParseFile(MakeTempPath("no_such_feed").string() + ".xml", &feed, &missing_file));
    EXPECT_TRUE(missing_file.code == ErrorCode::ParseFailure);
}

static void TestFeedToSortedSet() {
    std::filesystem::path path = MakeTempPath("forecast_feed").replace_extension(".xml");
    {
        std::ofstream out(path, std::ios::binary);
        out << kFeedXml;
    }
    ForecastXmlParser parser;
    ParsedFeed feed;
    Error error;
    bool parsed = parser.ParseFile(path.string(), &feed, &error);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    ASSERT_TRUE(parsed);

    ForecastDateResolver resolver(2);
    ResolveResult result;
    ASSERT_TRUE(resolver.Resolve(feed.dataset, "2025-10-15", &result, &error));
    CityForecastSet set = CityForecastSet::Build(result.effective_date, result.records, &result.warnings);
    ASSERT_TRUE(set.Size() == 2u);
    EXPECT_EQ(set.Records()[0].name_eng, std::string("Zefat"));
    EXPECT_EQ(set.Records()[1].name_eng, std::string("Elat"));
    EXPECT_TRUE(result.warnings.empty());
}

int main() {
    TestTimeUtilDates();
    TestTemperatureRange();
    TestWeatherCodeMapping();
    TestSortNorthToSouth();
    TestCityForecastSetDropsDuplicates();
    TestResolverExactDate();
    TestResolverSkipsToNextDate();
    TestResolverNoData();
    TestResolverCountWarning();
    TestResolverRejectsBadDate();
    TestXmlParserGroupsByDate();
    TestXmlParserDecodesHebrewCodepage();
    TestXmlParserFailures();
    TestFeedToSortedSet();

    return ReportResult("forecast_card_data_tests");
}
