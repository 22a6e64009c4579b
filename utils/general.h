#pragma once
#include <string>
#include "yaml_load.h"
// 取得根目录路径
std::string get_root_path_string();
// 默认参数 + cfgs目录中的yaml, yaml不存在时只使用默认值
void load_default_environment(const std::string& cfg_file, VariantConfigs& opts, VariantConfigs& hyps);

std::string increment_path(const std::string prj_and_name, bool exist_ok = true, std::string sep = "");
