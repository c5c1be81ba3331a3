#include <catch2/catch_test_macros.hpp>

#include "glyph_run_test_utils.hpp"

using namespace ShapedText;

namespace {

struct DrawableCounters {
	int created;
	int destroyed;
};

}

static GlyphRunDrawable create_test_drawable(const GlyphRun& glyphRun, void* pUserData);
static void destroy_test_drawable(const GlyphRunDrawable& drawable, void* pUserData);

static void test_round_trip(const GlyphRun& glyphRun);

TEST_CASE("Bounds", "[GlyphRun]") {
	SECTION("Supplied advances") {
		auto glyphRun = build_test_run(u"abcd", {0, 1, 2, 3}, {10.f, 12.f, 8.f, 10.f}, 0);

		REQUIRE(glyphRun.get_bounds() == Rect{0.f, 0.f, 40.f, 1000.f});
		REQUIRE(&glyphRun.get_bounds() == &glyphRun.get_bounds());
		REQUIRE(glyphRun.get_bounds().width == 40.f);
	}

	SECTION("Advances derived from the typeface") {
		GlyphRunBuilder builder;
		std::optional<GlyphRun> glyphRun;

		builder.set_typeface(make_test_typeface(400.f, {500.f, 600.f}));
		builder.set_font_rendering_em_size(2000.f);
		builder.set_glyph_indices({0, 1, 2});
		builder.set_glyph_clusters({0, 1, 2});
		builder.set_characters(u"abc");

		REQUIRE(builder.build(glyphRun) == GlyphRunError::NONE);
		REQUIRE(glyphRun->get_scale() == 2.f);
		REQUIRE(glyphRun->get_glyph_advance(0) == 1000.f);
		REQUIRE(glyphRun->get_glyph_advance(1) == 1200.f);
		REQUIRE(glyphRun->get_glyph_advance(2) == 800.f);
		REQUIRE(glyphRun->get_bounds() == Rect{0.f, 0.f, 3000.f, 2000.f});
	}

	SECTION("Supplied bounds") {
		GlyphRunBuilder builder;
		std::optional<GlyphRun> glyphRun;

		builder.set_typeface(make_test_typeface());
		builder.set_font_rendering_em_size(TEST_EM_SIZE);
		builder.set_glyph_indices({1, 2});
		builder.set_glyph_advances({10.f, 10.f});
		builder.set_glyph_clusters({0, 1});
		builder.set_characters(u"ab");
		builder.set_bounds({1.f, 2.f, 3.f, 4.f});

		REQUIRE(builder.build(glyphRun) == GlyphRunError::NONE);
		REQUIRE(glyphRun->get_bounds() == Rect{1.f, 2.f, 3.f, 4.f});
	}
}

TEST_CASE("Find Glyph Index", "[GlyphRun]") {
	SECTION("Left to right") {
		auto glyphRun = build_test_run(u"abcd", {0, 1, 2, 3}, {10.f, 10.f, 10.f, 10.f}, 0);

		REQUIRE(glyphRun.find_glyph_index(0) == 0u);
		REQUIRE(glyphRun.find_glyph_index(2) == 2u);
		REQUIRE(glyphRun.find_glyph_index(3) == 3u);
		REQUIRE(glyphRun.find_glyph_index(4) == 4u);
		REQUIRE(glyphRun.find_glyph_index(100) == 4u);
	}

	SECTION("Left to right with a character offset") {
		auto glyphRun = build_test_run(u"abc", {10, 11, 12}, {10.f, 10.f, 10.f}, 0, 10);

		REQUIRE(glyphRun.find_glyph_index(5) == 0u);
		REQUIRE(glyphRun.find_glyph_index(11) == 1u);
		REQUIRE(glyphRun.find_glyph_index(13) == 3u);
	}

	SECTION("Ligature") {
		auto glyphRun = build_test_run(u"afib", {0, 1, 3}, {10.f, 18.f, 10.f}, 0);

		REQUIRE(glyphRun.find_glyph_index(1) == 1u);
		REQUIRE(glyphRun.find_glyph_index(2) == 1u);
		REQUIRE(glyphRun.find_glyph_index(3) == 2u);
	}

	SECTION("Multiple glyphs per cluster") {
		auto glyphRun = build_test_run(u"ab", {0, 0, 1}, {10.f, 2.f, 10.f}, 0);

		REQUIRE(glyphRun.find_glyph_index(0) == 0u);
		REQUIRE(glyphRun.find_glyph_index(1) == 2u);
	}

	SECTION("Right to left") {
		auto glyphRun = build_test_run(u"אב", {1, 0}, {10.f, 10.f}, 1);

		REQUIRE(glyphRun.find_glyph_index(0) == 1u);
		REQUIRE(glyphRun.find_glyph_index(1) == 0u);
		REQUIRE(glyphRun.find_glyph_index(5) == 0u);
	}

	SECTION("Right to left without glyphs for the first characters") {
		auto glyphRun = build_test_run(u"אבגד", {3, 1, 1}, {10.f, 10.f, 2.f}, 1);

		REQUIRE(glyphRun.find_glyph_index(0) == 1u);
		REQUIRE(glyphRun.find_glyph_index(1) == 1u);
		REQUIRE(glyphRun.find_glyph_index(2) == 1u);
		REQUIRE(glyphRun.find_glyph_index(3) == 0u);
	}

	SECTION("Right to left with multiple glyphs per cluster") {
		auto glyphRun = build_test_run(u"אבג", {2, 1, 1, 0}, {10.f, 10.f, 2.f, 10.f}, 1);

		REQUIRE(glyphRun.find_glyph_index(2) == 0u);
		REQUIRE(glyphRun.find_glyph_index(1) == 1u);
		REQUIRE(glyphRun.find_glyph_index(0) == 3u);
	}
}

TEST_CASE("Glyph Index Directionality", "[GlyphRun]") {
	SECTION("Left to right is non-decreasing") {
		auto glyphRun = build_test_run(u"abcdefg", {0, 1, 1, 3, 4, 6}, {1.f, 1.f, 1.f, 1.f, 1.f, 1.f}, 0);
		uint32_t previous = 0;

		for (uint32_t i = 0; i <= glyphRun.get_character_end(); ++i) {
			auto glyphIndex = glyphRun.find_glyph_index(i);
			REQUIRE(glyphIndex);
			REQUIRE(*glyphIndex >= previous);
			previous = *glyphIndex;
		}
	}

	SECTION("Right to left is non-increasing") {
		auto glyphRun = build_test_run(u"אבגדהוז", {6, 4, 3, 1, 1, 0}, {1.f, 1.f, 1.f, 1.f, 1.f, 1.f}, 1);
		uint32_t previous = glyphRun.get_glyph_count();

		for (uint32_t i = 0; i < glyphRun.get_character_end(); ++i) {
			auto glyphIndex = glyphRun.find_glyph_index(i);
			REQUIRE(glyphIndex);
			REQUIRE(*glyphIndex <= previous);
			previous = *glyphIndex;
		}
	}
}

TEST_CASE("Find Nearest Character Hit", "[GlyphRun]") {
	float width;

	SECTION("Single characters") {
		auto glyphRun = build_test_run(u"abcd", {0, 1, 2, 3}, {10.f, 10.f, 10.f, 10.f}, 0);

		REQUIRE(glyphRun.find_nearest_character_hit(2, width) == CharacterHit{2, 1});
		REQUIRE(width == 10.f);
	}

	SECTION("Ligature spans both characters") {
		auto glyphRun = build_test_run(u"fi", {0}, {18.f}, 0);

		REQUIRE(glyphRun.find_nearest_character_hit(0, width) == CharacterHit{0, 2});
		REQUIRE(width == 18.f);

		REQUIRE(glyphRun.find_nearest_character_hit(1, width) == CharacterHit{0, 2});
		REQUIRE(width == 18.f);
	}

	SECTION("Cluster width sums all glyphs") {
		auto glyphRun = build_test_run(u"ab", {0, 0, 1}, {10.f, 2.f, 10.f}, 0);

		REQUIRE(glyphRun.find_nearest_character_hit(0, width) == CharacterHit{0, 1});
		REQUIRE(width == 12.f);
	}

	SECTION("Right to left ligature") {
		auto glyphRun = build_test_run(u"אבג", {2, 0}, {10.f, 18.f}, 1);

		REQUIRE(glyphRun.find_nearest_character_hit(1, width) == CharacterHit{0, 2});
		REQUIRE(width == 18.f);

		REQUIRE(glyphRun.find_nearest_character_hit(2, width) == CharacterHit{2, 1});
		REQUIRE(width == 10.f);
	}

	SECTION("Past the end") {
		auto glyphRun = build_test_run(u"abcd", {0, 1, 2, 3}, {10.f, 10.f, 10.f, 10.f}, 0);

		REQUIRE(glyphRun.find_nearest_character_hit(4, width) == CharacterHit{4, 0});
		REQUIRE(width == 0.f);
	}
}

TEST_CASE("Distance From Character Hit", "[GlyphRun]") {
	auto glyphRun = build_test_run(u"abcd", {0, 1, 2, 3}, {10.f, 10.f, 10.f, 10.f}, 0);

	REQUIRE(glyphRun.get_bounds().width == 40.f);
	REQUIRE(glyphRun.get_distance_from_character_hit({0, 0}) == 0.f);
	REQUIRE(glyphRun.get_distance_from_character_hit({2, 0}) == 20.f);
	REQUIRE(glyphRun.get_distance_from_character_hit({2, 1}) == 30.f);
	REQUIRE(glyphRun.get_distance_from_character_hit({3, 1}) == 40.f);
	REQUIRE(glyphRun.get_distance_from_character_hit({4, 0}) == 40.f);
	REQUIRE(glyphRun.get_distance_from_character_hit({9, 1}) == 40.f);

	SECTION("Right to left") {
		auto rtlRun = build_test_run(u"אב", {1, 0}, {10.f, 10.f}, 1);

		REQUIRE(rtlRun.get_distance_from_character_hit({1, 0}) == 0.f);
		REQUIRE(rtlRun.get_distance_from_character_hit({0, 0}) == 10.f);
		REQUIRE(rtlRun.get_distance_from_character_hit({0, 1}) == 20.f);
	}
}

TEST_CASE("Character Hit From Distance", "[GlyphRun]") {
	auto glyphRun = build_test_run(u"abcd", {0, 1, 2, 3}, {10.f, 10.f, 10.f, 10.f}, 0);
	bool isInside;

	SECTION("Leading half of a cluster") {
		REQUIRE(glyphRun.get_character_hit_from_distance(25.f, isInside) == CharacterHit{2, 0});
		REQUIRE(isInside);
	}

	SECTION("Trailing half of a cluster") {
		REQUIRE(glyphRun.get_character_hit_from_distance(26.f, isInside) == CharacterHit{2, 1});
		REQUIRE(isInside);
	}

	SECTION("Before the run") {
		REQUIRE(glyphRun.get_character_hit_from_distance(-5.f, isInside) == CharacterHit{0, 0});
		REQUIRE(!isInside);
	}

	SECTION("After the run") {
		REQUIRE(glyphRun.get_character_hit_from_distance(50.f, isInside) == CharacterHit{3, 1});
		REQUIRE(!isInside);
	}

	SECTION("Right to left") {
		auto rtlRun = build_test_run(u"אב", {1, 0}, {10.f, 10.f}, 1);

		REQUIRE(rtlRun.get_character_hit_from_distance(-1.f, isInside) == CharacterHit{1, 1});
		REQUIRE(!isInside);

		REQUIRE(rtlRun.get_character_hit_from_distance(21.f, isInside) == CharacterHit{0, 0});
		REQUIRE(!isInside);

		REQUIRE(rtlRun.get_character_hit_from_distance(4.f, isInside) == CharacterHit{1, 0});
		REQUIRE(isInside);
	}

	SECTION("Supplied bounds wider than the glyphs") {
		GlyphRunBuilder builder;
		std::optional<GlyphRun> wideRun;

		builder.set_typeface(make_test_typeface());
		builder.set_font_rendering_em_size(TEST_EM_SIZE);
		builder.set_glyph_indices({1, 2});
		builder.set_glyph_advances({10.f, 10.f});
		builder.set_glyph_clusters({0, 1});
		builder.set_characters(u"ab");
		builder.set_bounds({0.f, 0.f, 30.f, 10.f});

		REQUIRE(builder.build(wideRun) == GlyphRunError::NONE);
		REQUIRE(wideRun->get_character_hit_from_distance(28.f, isInside) == CharacterHit{1, 1});
		REQUIRE(isInside);
	}
}

TEST_CASE("Distance Round Trip", "[GlyphRun]") {
	test_round_trip(build_test_run(u"abcd", {0, 1, 2, 3}, {10.f, 10.f, 10.f, 10.f}, 0));
	test_round_trip(build_test_run(u"afib", {0, 1, 3}, {10.f, 18.f, 10.f}, 0));
	test_round_trip(build_test_run(u"ab", {0, 0, 1}, {10.f, 2.f, 10.f}, 0));
	test_round_trip(build_test_run(u"אב", {1, 0}, {10.f, 10.f}, 1));
	test_round_trip(build_test_run(u"אבג", {2, 0}, {10.f, 18.f}, 1));
}

TEST_CASE("Drawable", "[GlyphRun]") {
	DrawableCounters counters{};
	GlyphRunDrawableFunctions funcs{
		.pfnCreateDrawable = create_test_drawable,
		.pfnDestroyDrawable = destroy_test_drawable,
		.pUserData = &counters,
	};

	GlyphRunBuilder builder;
	builder.set_typeface(make_test_typeface());
	builder.set_font_rendering_em_size(TEST_EM_SIZE);
	builder.set_glyph_indices({1, 2});
	builder.set_glyph_advances({10.f, 15.f});
	builder.set_glyph_clusters({0, 1});
	builder.set_characters(u"ab");
	builder.set_drawable_functions(funcs);

	SECTION("Created once and destroyed once") {
		{
			std::optional<GlyphRun> glyphRun;
			REQUIRE(builder.build(glyphRun) == GlyphRunError::NONE);

			auto& drawable = glyphRun->get_drawable();
			REQUIRE(drawable);
			REQUIRE(drawable.measuredWidth == 25.f);

			glyphRun->get_drawable();
			REQUIRE(counters.created == 1);
			REQUIRE(counters.destroyed == 0);
		}

		REQUIRE(counters.created == 1);
		REQUIRE(counters.destroyed == 1);
	}

	SECTION("Ownership moves with the run") {
		{
			std::optional<GlyphRun> glyphRun;
			REQUIRE(builder.build(glyphRun) == GlyphRunError::NONE);
			glyphRun->get_drawable();

			auto moved = std::move(*glyphRun);
			glyphRun.reset();

			REQUIRE(counters.destroyed == 0);
			REQUIRE(moved.get_drawable());
		}

		REQUIRE(counters.created == 1);
		REQUIRE(counters.destroyed == 1);
	}

	SECTION("Never created when not requested") {
		{
			std::optional<GlyphRun> glyphRun;
			REQUIRE(builder.build(glyphRun) == GlyphRunError::NONE);
			REQUIRE(glyphRun->get_bounds().width == 25.f);
		}

		REQUIRE(counters.created == 0);
		REQUIRE(counters.destroyed == 0);
	}

	SECTION("No drawable functions") {
		auto glyphRun = build_test_run(u"ab", {0, 1}, {10.f, 10.f}, 0);
		REQUIRE(!glyphRun.get_drawable());
	}
}

static GlyphRunDrawable create_test_drawable(const GlyphRun& glyphRun, void* pUserData) {
	auto* pCounters = static_cast<DrawableCounters*>(pUserData);
	++pCounters->created;

	return {
		.handle = pUserData,
		.measuredWidth = glyphRun.get_bounds().width,
	};
}

// Runs from ~GlyphRun, so failures must not throw
static void destroy_test_drawable(const GlyphRunDrawable& drawable, void* pUserData) {
	CHECK(drawable.handle == pUserData);
	++static_cast<DrawableCounters*>(pUserData)->destroyed;
}

static void test_round_trip(const GlyphRun& glyphRun) {
	auto& clusters = glyphRun.get_glyph_clusters();

	for (auto cluster : clusters) {
		CharacterHit hit{cluster, 0};
		bool isInside;

		auto distance = glyphRun.get_distance_from_character_hit(hit);
		auto result = glyphRun.get_character_hit_from_distance(distance, isInside);

		REQUIRE(isInside);
		REQUIRE(glyphRun.get_distance_from_character_hit(result) == distance);
	}
}
