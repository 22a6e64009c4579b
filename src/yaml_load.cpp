#include "yaml_load.h"

#include <torch/torch.h>

#include <ostream>
#include <tuple>
#include <vector>
#include <iostream>
#include <string>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include "utils.h"

VariantConfigs set_cfg_feed_default()
{
    VariantConfigs opts;
    opts["data"] = "data/annotations.csv";      // path,x1,y1,x2,y2,class_name
    opts["categories"] = "data/categories.txt";
    opts["hierarchy"] = "";                     // 为空时使用one-hot, 否则读取darknet格式的tree文件
    opts["separator"] = ",";
    opts["img_input"] = 416;
    opts["shrink_factor"] = 32;
    opts["n_anchors"] = 5;
    opts["n_classes"] = 0;                      // 0: 由categories文件决定
    opts["multi_scale"] = std::vector<float>({ 0.6153846f, 0.7692308f, 0.9230769f, 1.0f, 1.1538462f, 1.3076923f });
    opts["scale_interval"] = 10;                // 每隔多少个slice重新选择一次multi_scale
    opts["batch_size"] = 8;
    opts["scaling_factor"] = 5;
    opts["augment"] = true;
    opts["seed"] = -1;                          // <0: 使用std::random_device

    return opts;
}

VariantConfigs set_cfg_hyp_default()
{
    VariantConfigs hyps;

    hyps["degrees"] = 5.0f;  // image rotation(+/ -deg)
    hyps["translate"] = 0.1f;  // image translation(+/ -fraction)
    hyps["scale"] = 0.2f;  // image scale(+/ -gain)
    hyps["shear"] = 2.0f;  // image shear(+/ -deg)
    hyps["perspective"] = 0.0f;  // image perspective(+/ -fraction), range 0 - 0.001
    hyps["hsv_h"] = 0.015f;  // image HSV - Hue augmentation(fraction)
    hyps["hsv_s"] = 0.7f;  // image HSV - Saturation augmentation(fraction)
    hyps["hsv_v"] = 0.4f;  // image HSV - Value augmentation(fraction)
    hyps["fliplr"] = 0.5f;  // image flip left - right(probability)

    return hyps;
}

VariantConfigs load_cfg_yaml(const std::string& cfgs_file)
{
    TORCH_CHECK(std::filesystem::exists(cfgs_file), "config file ", cfgs_file, " not exists.");

    VariantConfigs cfgs;
    YAML::Node doc = YAML::LoadFile(cfgs_file);

    std::regex int_regex("^-?\\d+$");
    std::regex float_regex("^-?\\d+(\\.\\d+)?([eE][-+]?\\d+)?$");
    auto check_node_scalartype = [&](const YAML::Node& node) {
        std::string str_value = node.as<std::string>();
        if (std::regex_match(str_value, int_regex))
            return 1;
        else if (std::regex_match(str_value, float_regex))
            return 2;
        return 0;
        };

    for (auto it = doc.begin(); it != doc.end(); ++it)
    {
        const std::string& key = it->first.as<std::string>();
        const YAML::Node& value_node = it->second;

        if (value_node.IsScalar()) {
            switch (check_node_scalartype(value_node))
            {
            case 1:
                cfgs[key] = value_node.as<int>();
                break;
            case 2:
                cfgs[key] = value_node.as<float>();
                break;
            default:
                std::string tmpstr = value_node.as<std::string>();
                if (tmpstr == "True" || tmpstr == "true")
                    cfgs[key] = true;
                else if (tmpstr == "False" || tmpstr == "false")
                    cfgs[key] = false;
                else
                    cfgs[key] = tmpstr;
                break;
            }
        }
        else if (value_node.IsNull()) {
            cfgs[key] = std::string("");
        }
        else if (value_node.IsSequence())
        {
            // 只要有一个元素不是整数, 整个序列按float处理
            bool all_int = true;
            for (const auto& e : value_node)
            {
                if (check_node_scalartype(e) != 1)
                    all_int = false;
            }
            if (all_int)
                cfgs[key] = value_node.as<std::vector<int>>();
            else
                cfgs[key] = value_node.as<std::vector<float>>();
        }
        else
        {
            LOG(WARNING) << "config key " << key << " in " << cfgs_file << " is a map, ignored.";
        }
    }
    return cfgs;
}

void merge_cfgs(VariantConfigs& base, const VariantConfigs& overrides)
{
    for (const auto& [key, value] : overrides)
    {
        auto it = base.find(key);
        if (it == base.end() || it->second.index() == value.index())
        {
            base[key] = value;
            continue;
        }

        // 以默认值的类型为准做转换
        VariantValue& v = it->second;
        if (std::holds_alternative<float>(v) && std::holds_alternative<int>(value))
            v = float(std::get<int>(value));
        else if (std::holds_alternative<int>(v) && std::holds_alternative<float>(value))
            v = int(std::get<float>(value));
        else if (std::holds_alternative<std::vector<float>>(v) && std::holds_alternative<std::vector<int>>(value))
        {
            const auto& src = std::get<std::vector<int>>(value);
            v = std::vector<float>(src.begin(), src.end());
        }
        else if (std::holds_alternative<std::string>(v) && std::holds_alternative<int>(value))
            v = std::to_string(std::get<int>(value));
        else
        {
            LOG(WARNING) << "config key " << key << " type changed from index "
                << v.index() << " to " << value.index();
            v = value;
        }
    }
}

//#include <iomanip> 通过指定保留位能避免科学表达，但要判定截断出错，暂不考虑
void save_cfg_yaml(const VariantConfigs& cfgs, const std::string& optfile)
{
    auto float_str = [](float f) {
        // 解决存储时，1.0 --> 1的问题
        std::stringstream ss;
        ss << f;
        std::string s = ss.str();
        if (s.find('.') == std::string::npos && s.find('e') == std::string::npos)
            s = s + ".0";
        return s;
        };

    YAML::Node node;
    for (const auto& [key, value] : cfgs) {
        std::visit([&](auto&& arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, std::vector<int>>) {
                YAML::Node seq;
                for (const auto& item : arg) seq.push_back(item);
                node[key] = seq;
            }
            else if constexpr (std::is_same_v<T, std::vector<float>>) {
                YAML::Node seq;
                for (const auto& item : arg) seq.push_back(float_str(item));
                node[key] = seq;
            }
            else if constexpr (std::is_same_v<T, float>) {
                node[key] = float_str(arg);
            }
            else
            {
                node[key] = arg;
            }
            }, value);
    }

    std::ofstream fout(optfile);
    if (!fout.is_open())
    {
        LOG(ERROR) << "open " << optfile << " for write failed.";
        return;
    }
    fout << node;
}

void show_cfg_info(const std::string& title, const VariantConfigs& cfgs)
{
    std::cout << ColorString(title + ": ", "R");
    for (const auto& [key, value] : cfgs)
    {
        std::cout << key << ": ";
        std::visit([&](auto&& arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, bool>) {
                std::cout << (arg ? "true " : "false ");
            }
            else if constexpr (std::is_same_v<T, std::vector<int>> || std::is_same_v<T, std::vector<float>>) {
                std::cout << "[ ";
                for (const auto& item : arg)
                    std::cout << item << " ";
                std::cout << "] ";
            }
            else {
                std::cout << arg << " ";
            }
            }, value);
    }
    std::cout << std::endl;
}

namespace {
const VariantValue& find_cfg(const VariantConfigs& cfgs, const std::string& key)
{
    auto it = cfgs.find(key);
    TORCH_CHECK(it != cfgs.end(), "config key '", key, "' not found.");
    return it->second;
}
}

int get_cfg_int(const VariantConfigs& cfgs, const std::string& key)
{
    const auto& v = find_cfg(cfgs, key);
    if (std::holds_alternative<float>(v))
        return int(std::get<float>(v));
    TORCH_CHECK(std::holds_alternative<int>(v), "config key '", key, "' expected int.");
    return std::get<int>(v);
}

float get_cfg_float(const VariantConfigs& cfgs, const std::string& key)
{
    const auto& v = find_cfg(cfgs, key);
    if (std::holds_alternative<int>(v))
        return float(std::get<int>(v));
    TORCH_CHECK(std::holds_alternative<float>(v), "config key '", key, "' expected float.");
    return std::get<float>(v);
}

bool get_cfg_bool(const VariantConfigs& cfgs, const std::string& key)
{
    const auto& v = find_cfg(cfgs, key);
    TORCH_CHECK(std::holds_alternative<bool>(v), "config key '", key, "' expected bool.");
    return std::get<bool>(v);
}

std::string get_cfg_string(const VariantConfigs& cfgs, const std::string& key)
{
    const auto& v = find_cfg(cfgs, key);
    TORCH_CHECK(std::holds_alternative<std::string>(v), "config key '", key, "' expected string.");
    return std::get<std::string>(v);
}

std::vector<float> get_cfg_floats(const VariantConfigs& cfgs, const std::string& key)
{
    const auto& v = find_cfg(cfgs, key);
    if (std::holds_alternative<std::vector<int>>(v))
    {
        const auto& src = std::get<std::vector<int>>(v);
        return std::vector<float>(src.begin(), src.end());
    }
    if (std::holds_alternative<float>(v))
        return { std::get<float>(v) };
    TORCH_CHECK(std::holds_alternative<std::vector<float>>(v), "config key '", key, "' expected float sequence.");
    return std::get<std::vector<float>>(v);
}
