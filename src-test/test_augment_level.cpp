#include <gtest/gtest.h>
#include "datasets.h"

namespace
{
	std::vector<LabelRecord> make_labels(const std::vector<std::pair<std::string, int>>& counts)
	{
		std::vector<LabelRecord> y;
		for (const auto& [name, n] : counts)
		{
			for (int i = 0; i < n; i++)
			{
				LabelRecord r;
				r.box = Box(10.0f, 10.0f, 4.0f, 4.0f);
				r.name = name;
				y.push_back(r);
			}
		}
		return y;
	}
}


TEST(AugmentLevel, RareClassesGetMore)
{
	/* frequencies [100, 10, 1], mean = 37
	 * int(5 * 37 / 100) = 1
	 * int(5 * 37 / 10)  = 18
	 * int(5 * 37 / 1)   = 185
	 */
	const auto level = calc_augment_level(make_labels({ {"stop", 100}, {"yield", 10}, {"merge", 1} }), 5);
	ASSERT_EQ(3u, level.size());
	ASSERT_EQ(1, level.at("stop"));
	ASSERT_EQ(18, level.at("yield"));
	ASSERT_EQ(185, level.at("merge"));
}


TEST(AugmentLevel, EqualFrequencies)
{
	const auto level = calc_augment_level(make_labels({ {"a", 7}, {"b", 7}, {"c", 7} }), 5);
	for (const auto& [name, n] : level)
	{
		ASSERT_EQ(5, n) << name;
	}
}


TEST(AugmentLevel, ZeroScalingFactor)
{
	const auto level = calc_augment_level(make_labels({ {"a", 3}, {"b", 1} }), 0);
	ASSERT_EQ(0, level.at("a"));
	ASSERT_EQ(0, level.at("b"));
}


TEST(AugmentLevel, Empty)
{
	ASSERT_TRUE(calc_augment_level({}, 5).empty());
}


TEST(AugmentLevel, MonotonicInFrequency)
{
	std::mt19937 gen(42);
	std::uniform_int_distribution<int> n_classes(1, 12);
	std::uniform_int_distribution<int> freq(1, 300);
	std::uniform_int_distribution<int> factor(0, 10);

	for (int round = 0; round < 200; round++)
	{
		std::vector<std::pair<std::string, int>> counts;
		const int n = n_classes(gen);
		for (int i = 0; i < n; i++)
			counts.emplace_back("class_" + std::to_string(i), freq(gen));

		const int scaling_factor = factor(gen);
		const auto level = calc_augment_level(make_labels(counts), scaling_factor);
		ASSERT_EQ(size_t(n), level.size());

		for (const auto& [name_a, freq_a] : counts)
		{
			ASSERT_GE(level.at(name_a), 0);
			for (const auto& [name_b, freq_b] : counts)
			{
				if (freq_a > freq_b)
				{
					ASSERT_LE(level.at(name_a), level.at(name_b)) << name_a << "=" << freq_a << " " << name_b << "=" << freq_b;
				}
			}
		}
	}
}
