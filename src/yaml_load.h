#pragma once

#include <yaml-cpp/yaml.h>

#include <iomanip>
#include <iostream>
#include <memory>
#include <tuple>
#include <string>
#include <vector>

#include <variant>
#include <algorithm>
#include <unordered_map>

// 判定指定名字是否在指定的列表中
inline bool check_str_in_strs(const std::vector<std::string>& names, const std::string& name){
    return std::count(names.begin(),
                        names.end(), name);
}

// multi_scale 需要 float 序列, 在原来的基础上添加 std::vector<float>
using VariantValue = std::variant<std::string, int, bool, float, std::vector<int>, std::vector<float>>;

using VariantConfigs = std::unordered_map<std::string, VariantValue>;

// feed的默认参数，所有key都在这里登记
VariantConfigs set_cfg_feed_default();
// 数据增强的超参数
VariantConfigs set_cfg_hyp_default();

VariantConfigs load_cfg_yaml(const std::string& cfgs_file);
void save_cfg_yaml(const VariantConfigs& cfgs, const std::string& optfile);

// overrides中的值覆盖base, 类型以base中已有的为准
void merge_cfgs(VariantConfigs& base, const VariantConfigs& overrides);

void show_cfg_info(const std::string& title, const VariantConfigs& cfgs);

// Typed getters. A missing key or a mismatched alternative is a configuration error.
int get_cfg_int(const VariantConfigs& cfgs, const std::string& key);
float get_cfg_float(const VariantConfigs& cfgs, const std::string& key);
bool get_cfg_bool(const VariantConfigs& cfgs, const std::string& key);
std::string get_cfg_string(const VariantConfigs& cfgs, const std::string& key);
std::vector<float> get_cfg_floats(const VariantConfigs& cfgs, const std::string& key);
