#include <gtest/gtest.h>
#include <string>
#include "grabber/griddata.h"

namespace {
	constexpr int64_t jan1 = 1704067200; // 2024-01-01T00:00:00Z

	json::TextCallback text(const std::string& s) {
		size_t head = 0;
		return [s, head]() mutable -> int16_t {
			if (head >= s.size()) return -1;
			return (uint8_t)s[head++];
		};
	}

	const char * const grid_body = R"({
		"@context": ["https://geojson.org/geojson-ld/geojson-context.jsonld"],
		"id": "https://api.weather.gov/gridpoints/TOP/31,80",
		"properties": {
			"updateTime": "2024-01-01T00:00:00+00:00",
			"temperature": {
				"uom": "wmoUnit:degC",
				"values": [
					{"validTime": "2024-01-01T00:00:00+00:00/PT6H", "value": 0},
					{"validTime": "2024-01-01T06:00:00+00:00/PT1H", "value": 2.2},
					{"validTime": "bogus/PT1H", "value": 99}
				]
			},
			"apparentTemperature": {
				"values": [{"validTime": "2024-01-01T00:00:00+00:00/PT12H", "value": null}]
			},
			"windSpeed": {
				"values": [{"validTime": "2024-01-01T00:00:00+00:00/P1D", "value": 16}]
			},
			"windGust": {"values": []},
			"probabilityOfPrecipitation": {
				"values": [{"validTime": "2024-01-01T00:00:00+00:00/PT3H", "value": 70}]
			},
			"quantitativePrecipitation": {
				"values": [
					{"validTime": "2024-01-01T01:00:00+00:00/PT2H", "value": 2.54},
					{"validTime": "2024-01-01T06:00:00+00:00/PT6H", "value": 5.08}
				]
			},
			"snowfallAmount": {
				"values": [
					{"validTime": "2024-01-01T01:00:00+00:00/PT2H", "value": 25.4},
					{"validTime": "2024-01-01T03:00:00+00:00/PT1H", "value": 0}
				]
			},
			"skyCover": {
				"values": [{"validTime": "2024-01-01T00:00:00+00:00/PT1H", "value": 100}]
			}
		}
	})";
}

TEST(ParsePoints, FindsTheGridUrl) {
	std::string url;
	ASSERT_TRUE(griddata::parse_points(text(R"({"id":"x","properties":{"gridId":"TOP","forecastGridData":"https://api.weather.gov/gridpoints/TOP/31,80","forecast":"y"}})"), url));
	EXPECT_EQ(url, "https://api.weather.gov/gridpoints/TOP/31,80");
}

TEST(ParsePoints, FailsWithoutTheUrl) {
	std::string url;
	EXPECT_FALSE(griddata::parse_points(text(R"({"properties":{"forecast":"y"}})"), url));
	EXPECT_FALSE(griddata::parse_points(text(R"({"forecastGridData":"https://x/y"})"), url));
	EXPECT_FALSE(griddata::parse_points(text(R"({"properties":{"forecastGridData":)"), url));
	EXPECT_FALSE(griddata::parse_points(text("<html>"), url));
}

TEST(ParseGrid, ReadsEveryQuantity) {
	griddata::GridProperties props;
	ASSERT_TRUE(griddata::parse_grid(text(grid_body), props));

	// the unparseable validTime is skipped
	ASSERT_EQ(props.temperature.size(), 2u);
	EXPECT_EQ(props.temperature[0].start, jan1);
	EXPECT_EQ(props.temperature[0].hours, 6);
	EXPECT_EQ(props.temperature[0].value, 0.0);
	EXPECT_EQ(props.temperature[1].value, 2.2);

	ASSERT_EQ(props.apparent_temperature.size(), 1u);
	EXPECT_FALSE(props.apparent_temperature[0].value.has_value());
	EXPECT_EQ(props.apparent_temperature[0].hours, 12);

	ASSERT_EQ(props.wind_speed.size(), 1u);
	EXPECT_EQ(props.wind_speed[0].hours, 1);

	EXPECT_TRUE(props.wind_gust.empty());
	EXPECT_EQ(props.probability_of_precipitation.size(), 1u);
	EXPECT_EQ(props.quantitative_precipitation.size(), 2u);
	EXPECT_EQ(props.snowfall_amount.size(), 2u);
}

TEST(ParseGrid, RejectsBodiesWithoutProperties) {
	griddata::GridProperties props;
	EXPECT_FALSE(griddata::parse_grid(text(R"({"type":"Feature"})"), props));
	EXPECT_FALSE(griddata::parse_grid(text(R"({"properties":[]})"), props));
	EXPECT_FALSE(griddata::parse_grid(text(R"({"properties":{"temperature":{"values":[)"), props));
}

TEST(ParseGrid, EmptyPropertiesIsFine) {
	griddata::GridProperties props;
	EXPECT_TRUE(griddata::parse_grid(text(R"({"properties":{}})"), props));
	EXPECT_TRUE(props.temperature.empty());
}

TEST(Normalize, BuildsHourlyAndPrecipitation) {
	griddata::GridProperties props;
	ASSERT_TRUE(griddata::parse_grid(text(grid_body), props));

	auto data = griddata::normalize(props, jan1 + 120, 12, payload::UnitSystem::IMPERIAL);

	ASSERT_EQ(data.hourly.size(), 12u);
	for (int i = 0; i < 6; ++i) {
		EXPECT_EQ(data.hourly[i].timestamp, jan1 + i * 3600);
		EXPECT_EQ(data.hourly[i].temp, 32);
	}
	EXPECT_EQ(data.hourly[6].temp, 36); // 35.96
	EXPECT_EQ(data.hourly[11].temp, 36);
	EXPECT_FALSE(data.hourly[0].feels_like.has_value());
	EXPECT_FALSE(data.hourly[0].wind_gust.has_value());
	EXPECT_EQ(data.hourly[3].wind_speed, 10);
	EXPECT_DOUBLE_EQ(data.hourly[2].pop, 0.7);
	EXPECT_DOUBLE_EQ(data.hourly[5].pop, 0.7);

	// snow replaces rain at index 1, rain at 6 is kept (36F)
	ASSERT_EQ(data.precipitation_periods.size(), 2u);
	const auto& snow = data.precipitation_periods[0];
	EXPECT_EQ(snow.kind, payload::PrecipitationPeriod::FROZEN);
	EXPECT_EQ(snow.start_index, 1);
	EXPECT_EQ(snow.end_index, 3);
	EXPECT_DOUBLE_EQ(snow.amount_display, 1.0);
	EXPECT_DOUBLE_EQ(snow.display_threshold, 0.1);

	const auto& rain = data.precipitation_periods[1];
	EXPECT_EQ(rain.kind, payload::PrecipitationPeriod::LIQUID);
	EXPECT_EQ(rain.start_index, 6);
	EXPECT_EQ(rain.end_index, 12);
	EXPECT_DOUBLE_EQ(rain.amount_display, 0.2);
}

TEST(Normalize, IsDeterministic) {
	griddata::GridProperties props;
	ASSERT_TRUE(griddata::parse_grid(text(grid_body), props));

	auto a = griddata::normalize(props, jan1, 48, payload::UnitSystem::METRIC);
	auto b = griddata::normalize(props, jan1, 48, payload::UnitSystem::METRIC);

	ASSERT_EQ(a.hourly.size(), b.hourly.size());
	for (size_t i = 0; i < a.hourly.size(); ++i) {
		EXPECT_EQ(a.hourly[i].timestamp, b.hourly[i].timestamp);
		EXPECT_EQ(a.hourly[i].temp, b.hourly[i].temp);
		EXPECT_EQ(a.hourly[i].pop, b.hourly[i].pop);
	}
	ASSERT_EQ(a.precipitation_periods.size(), b.precipitation_periods.size());
	for (size_t i = 0; i < a.precipitation_periods.size(); ++i) {
		EXPECT_EQ(a.precipitation_periods[i].start_index, b.precipitation_periods[i].start_index);
		EXPECT_EQ(a.precipitation_periods[i].amount_native, b.precipitation_periods[i].amount_native);
	}
}

TEST(Normalize, HugeDurationDoesNotBlowUp) {
	griddata::GridProperties props;
	ASSERT_TRUE(griddata::parse_grid(text(R"({"properties":{
		"temperature":{"values":[{"validTime":"2024-01-01T00:00:00Z/PT400000000H","value":5}]},
		"quantitativePrecipitation":{"values":[{"validTime":"2024-01-01T00:00:00Z/PT400000000H","value":2.54}]}
	}})"), props));
	ASSERT_EQ(props.temperature.size(), 1u);
	EXPECT_EQ(props.temperature[0].hours, 400000000);

	auto data = griddata::normalize(props, jan1, 48, payload::UnitSystem::IMPERIAL);
	ASSERT_EQ(data.hourly.size(), 48u);
	EXPECT_EQ(data.hourly[47].temp, 41);

	ASSERT_EQ(data.precipitation_periods.size(), 1u);
	EXPECT_EQ(data.precipitation_periods[0].start_index, 0);
	EXPECT_EQ(data.precipitation_periods[0].end_index, 48);
}
