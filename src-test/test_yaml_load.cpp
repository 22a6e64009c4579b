#include <gtest/gtest.h>
#include "yaml_load.h"
#include "test_helpers.hpp"

TEST(YamlLoad, ScalarTypes)
{
	TempDir dir("yaml");
	write_text(dir.file("cfg.yaml"),
		"batch_size: 16\n"
		"lr: 0.01\n"
		"augment: false\n"
		"data: data/train.csv\n"
		"hierarchy:\n"
		"multi_scale: [0.5, 1, 1.5]\n"
		"sizes: [320, 416]\n");

	auto cfgs = load_cfg_yaml(dir.file("cfg.yaml"));
	ASSERT_EQ(16, std::get<int>(cfgs["batch_size"]));
	ASSERT_FLOAT_EQ(0.01f, std::get<float>(cfgs["lr"]));
	ASSERT_FALSE(std::get<bool>(cfgs["augment"]));
	ASSERT_EQ("data/train.csv", std::get<std::string>(cfgs["data"]));
	ASSERT_EQ("", std::get<std::string>(cfgs["hierarchy"]));

	auto ms = std::get<std::vector<float>>(cfgs["multi_scale"]);
	ASSERT_EQ(3u, ms.size());
	ASSERT_FLOAT_EQ(1.0f, ms[1]);

	auto sizes = std::get<std::vector<int>>(cfgs["sizes"]);
	ASSERT_EQ(2u, sizes.size());
	ASSERT_EQ(416, sizes[1]);
}


TEST(YamlLoad, MissingFile)
{
	ASSERT_THROW(load_cfg_yaml("/nonexistent/cfg.yaml"), c10::Error);
}


TEST(YamlLoad, MergeKeepsDefaultTypes)
{
	auto base = set_cfg_feed_default();
	VariantConfigs overrides;
	overrides["multi_scale"] = std::vector<int>({ 1, 2 });
	overrides["batch_size"] = 4;
	overrides["img_input"] = 320.0f;
	overrides["extra"] = std::string("value");

	merge_cfgs(base, overrides);
	ASSERT_TRUE(std::holds_alternative<std::vector<float>>(base["multi_scale"]));
	ASSERT_EQ(4, get_cfg_int(base, "batch_size"));
	ASSERT_TRUE(std::holds_alternative<int>(base["img_input"]));
	ASSERT_EQ(320, get_cfg_int(base, "img_input"));
	ASSERT_EQ("value", get_cfg_string(base, "extra"));

	auto ms = get_cfg_floats(base, "multi_scale");
	ASSERT_EQ(2u, ms.size());
	ASSERT_FLOAT_EQ(2.0f, ms[1]);
}


TEST(YamlLoad, SaveThenLoad)
{
	TempDir dir("yaml_save");
	auto hyps = set_cfg_hyp_default();
	hyps["degrees"] = 1.0f;
	save_cfg_yaml(hyps, dir.file("hyp.yaml"));

	auto loaded = load_cfg_yaml(dir.file("hyp.yaml"));
	ASSERT_EQ(hyps.size(), loaded.size());
	// 1.0 不能被存成 1 再读成 int
	ASSERT_TRUE(std::holds_alternative<float>(loaded["degrees"]));
	ASSERT_FLOAT_EQ(1.0f, get_cfg_float(loaded, "degrees"));
	ASSERT_FLOAT_EQ(0.5f, get_cfg_float(loaded, "fliplr"));
}


TEST(YamlLoad, Getters)
{
	VariantConfigs cfgs;
	cfgs["n"] = 3;
	cfgs["f"] = 2.5f;
	cfgs["b"] = true;
	cfgs["s"] = std::string("abc");

	ASSERT_EQ(3, get_cfg_int(cfgs, "n"));
	ASSERT_FLOAT_EQ(3.0f, get_cfg_float(cfgs, "n"));
	ASSERT_EQ(2, get_cfg_int(cfgs, "f"));
	ASSERT_TRUE(get_cfg_bool(cfgs, "b"));
	ASSERT_EQ("abc", get_cfg_string(cfgs, "s"));
	ASSERT_EQ(1u, get_cfg_floats(cfgs, "f").size());

	ASSERT_THROW(get_cfg_int(cfgs, "missing"), c10::Error);
	ASSERT_THROW(get_cfg_bool(cfgs, "n"), c10::Error);
	ASSERT_THROW(get_cfg_string(cfgs, "b"), c10::Error);
}


TEST(YamlLoad, DefaultsComplete)
{
	auto opts = set_cfg_feed_default();
	for (const char* key : { "data", "categories", "hierarchy", "separator", "img_input", "shrink_factor",
		"n_anchors", "n_classes", "multi_scale", "scale_interval", "batch_size", "scaling_factor", "augment", "seed" })
	{
		ASSERT_TRUE(opts.count(key)) << key;
	}
	ASSERT_EQ(416, get_cfg_int(opts, "img_input"));
	ASSERT_EQ(32, get_cfg_int(opts, "shrink_factor"));
	ASSERT_EQ(5, get_cfg_int(opts, "scaling_factor"));
}
