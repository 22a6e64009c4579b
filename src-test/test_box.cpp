#include <gtest/gtest.h>
#include "box.h"

#include <random>

TEST(Box, ConvertCorners)
{
	const Box b = convert_bbox(20.0f, 10.0f, 100.0f, 80.0f);
	ASSERT_FLOAT_EQ(60.0f, b.x);
	ASSERT_FLOAT_EQ(45.0f, b.y);
	ASSERT_FLOAT_EQ(80.0f, b.w);
	ASSERT_FLOAT_EQ(70.0f, b.h);
}


TEST(Box, ConvertSwappedCorners)
{
	// corners given bottom-right first must give the same box
	const Box a = convert_bbox(20.0f, 10.0f, 100.0f, 80.0f);
	const Box b = convert_bbox(100.0f, 80.0f, 20.0f, 10.0f);
	ASSERT_FLOAT_EQ(a.x, b.x);
	ASSERT_FLOAT_EQ(a.y, b.y);
	ASSERT_FLOAT_EQ(a.w, b.w);
	ASSERT_FLOAT_EQ(a.h, b.h);
}


TEST(Box, CornersRoundTrip)
{
	std::mt19937 gen(1234);
	std::uniform_real_distribution<float> dis(0.0f, 1.0f);

	for (int i = 0; i < 1000; i++)
	{
		float x1 = dis(gen);
		float y1 = dis(gen);
		float x2 = dis(gen);
		float y2 = dis(gen);
		if (x2 < x1) std::swap(x1, x2);
		if (y2 < y1) std::swap(y1, y2);

		const auto corners = convert_bbox(x1, y1, x2, y2).to_opencv_format();
		ASSERT_NEAR(x1, corners[0].x, 1e-6);
		ASSERT_NEAR(y1, corners[0].y, 1e-6);
		ASSERT_NEAR(x2, corners[1].x, 1e-6);
		ASSERT_NEAR(y2, corners[1].y, 1e-6);
	}
}


TEST(Box, BoxRoundTrip)
{
	const Box b(0.3125f, 0.4f, 0.25f, 0.5f);
	const Box r = convert_opencv_to_box(b.to_opencv_format());
	ASSERT_NEAR(b.x, r.x, 1e-6);
	ASSERT_NEAR(b.y, r.y, 1e-6);
	ASSERT_NEAR(b.w, r.w, 1e-6);
	ASSERT_NEAR(b.h, r.h, 1e-6);
}


TEST(Box, PixelRoundTrip)
{
	const Box b(123.5f, 77.25f, 40.0f, 31.5f);
	const Box r = convert_opencv_to_box(b.to_opencv_format());
	ASSERT_NEAR(b.x, r.x, 1e-4);
	ASSERT_NEAR(b.y, r.y, 1e-4);
	ASSERT_NEAR(b.w, r.w, 1e-4);
	ASSERT_NEAR(b.h, r.h, 1e-4);
}


TEST(Box, RelativeSize)
{
	const Box r = Box(320.0f, 240.0f, 64.0f, 48.0f).to_relative_size(640.0f, 480.0f);
	ASSERT_FLOAT_EQ(0.5f, r.x);
	ASSERT_FLOAT_EQ(0.5f, r.y);
	ASSERT_FLOAT_EQ(0.1f, r.w);
	ASSERT_FLOAT_EQ(0.1f, r.h);
}


TEST(Box, RelativeSizeNotClamped)
{
	// boxes larger than the image keep w, h > 1
	const Box r = Box(50.0f, 50.0f, 150.0f, 120.0f).to_relative_size(100.0f, 100.0f);
	ASSERT_FLOAT_EQ(1.5f, r.w);
	ASSERT_FLOAT_EQ(1.2f, r.h);
}
