#pragma once

namespace ShapedText {

struct Vector2 {
	float x;
	float y;

	constexpr bool operator==(const Vector2& other) const {
		return x == other.x && y == other.y;
	}

	constexpr bool operator!=(const Vector2& other) const {
		return !(*this == other);
	}
};

struct Rect {
	float x;
	float y;
	float width;
	float height;

	constexpr bool operator==(const Rect& other) const {
		return x == other.x && y == other.y && width == other.width && height == other.height;
	}

	constexpr bool operator!=(const Rect& other) const {
		return !(*this == other);
	}
};

}
