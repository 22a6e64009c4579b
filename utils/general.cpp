#include <filesystem>
#include <regex>
#include "general.h"
#include "utils.h"

std::string get_root_path_string()
{
    std::filesystem::path exe_path = std::filesystem::absolute(std::filesystem::current_path());
    std::string root_path = exe_path.string();
    // 在 build 目录下运行时, 根目录为上一级
    if (!std::filesystem::exists(exe_path / "cfgs") && std::filesystem::exists(exe_path.parent_path() / "cfgs"))
        root_path = exe_path.parent_path().string();
    LOG(INFO) << "The root dir: " << root_path;
    return root_path;
}

void load_default_environment(const std::string& cfg_file, VariantConfigs& opts, VariantConfigs& hyps)
{
    opts = set_cfg_feed_default();
    hyps = set_cfg_hyp_default();
    if (!std::filesystem::exists(std::filesystem::path(cfg_file))) {
        LOG(WARNING) << "Can't found " << cfg_file << " , will use default value";
        return;
    }

    // 同一个文件中的增强参数放到hyps中
    VariantConfigs loaded = load_cfg_yaml(cfg_file);
    VariantConfigs loaded_hyp;
    for (auto it = loaded.begin(); it != loaded.end();)
    {
        if (hyps.count(it->first))
        {
            loaded_hyp.insert(*it);
            it = loaded.erase(it);
        }
        else
            ++it;
    }
    for (const auto& [key, value] : loaded)
    {
        if (!opts.count(key))
            LOG(WARNING) << "unknown config key " << key << " in " << cfg_file;
    }
    merge_cfgs(opts, loaded);
    merge_cfgs(hyps, loaded_hyp);
}

std::string increment_path(const std::string prj_and_name, bool exist_ok/* = true*/, std::string sep/* = ""*/)
{
    auto pth = std::filesystem::path(prj_and_name);
    if (!std::filesystem::exists(pth))   return prj_and_name;
    if (std::filesystem::exists(pth) && exist_ok) return prj_and_name;

    std::vector<int> indices;
    std::regex pattern(pth.stem().string() + sep + "(\\d+)");

    for (const auto& entry : std::filesystem::directory_iterator(std::filesystem::path(prj_and_name).parent_path()))
    {
        if (entry.is_directory())
        {
            std::smatch match;
            std::string filename = entry.path().filename().string();
            if (std::regex_search(filename, match, pattern)) {
                indices.push_back(std::stoi(match[1].str()));
            }
        }
    }

    int n = 0;
    if (indices.empty())
        n = 1;
    else
        n = (*std::max_element(indices.begin(), indices.end()) + 1);

    return (prj_and_name + sep + std::to_string(n));
}
