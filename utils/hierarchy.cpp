#include "hierarchy.h"
#include "utils.h"

#include <filesystem>
#include <fstream>
#include <sstream>

OneHotEncoder::OneHotEncoder(int n_classes) : n(n_classes)
{
    TORCH_CHECK(n_classes > 0, "one-hot encoder needs at least one class, got ", n_classes);
}

torch::Tensor OneHotEncoder::encode_label(int index) const
{
    TORCH_CHECK(index >= 0 && index < n, "class index ", index, " out of range [0, ", n, ")");
    auto one_hot = torch::zeros({ n }, torch::kFloat32);
    one_hot[index] = 1.0f;
    return one_hot;
}

SoftmaxTree::SoftmaxTree(const std::string& tree_file)
{
    std::ifstream file(tree_file);
    TORCH_CHECK(file.is_open(), "open hierarchy tree file ", tree_file, " failed.");

    int last_parent = -1;
    int cur_group_size = 0;
    std::string line;
    while (std::getline(file, line))
    {
        line = trim_string(line);
        if (line.empty())
            continue;

        std::stringstream ss(line);
        std::string id;
        int p = -1;
        if (!(ss >> id >> p))
        {
            LOG(WARNING) << "hierarchy tree line \"" << line << "\" not right, skipped.";
            continue;
        }
        int n = static_cast<int>(parent.size());
        TORCH_CHECK(p < n, "tree node ", id, " refers to parent ", p, " defined after it.");

        // 同一个parent的连续节点为一个group
        if (p != last_parent)
        {
            group_size.push_back(cur_group_size);
            cur_group_size = 0;
            last_parent = p;
        }
        name.push_back(id);
        parent.push_back(p);
        ++cur_group_size;
    }
    int n = static_cast<int>(parent.size());
    TORCH_CHECK(n > 0, "hierarchy tree file ", tree_file, " is empty.");
    group_size.push_back(cur_group_size);

    leaf.assign(n, true);
    for (int i = 0; i < n; ++i)
    {
        if (parent[i] >= 0)
            leaf[parent[i]] = false;
    }

    LOG(INFO) << "load hierarchy tree " << tree_file << ": " << n << " nodes, " << groups() << " groups.";
}

torch::Tensor SoftmaxTree::encode_label(int index) const
{
    TORCH_CHECK(index >= 0 && index < size(), "class index ", index, " out of range [0, ", size(), ")");
    auto code = torch::zeros({ size() }, torch::kFloat32);
    int c = index;
    while (c >= 0)
    {
        code[c] = 1.0f;
        c = parent[c];
    }
    return code;
}

std::shared_ptr<LabelEncoder> make_label_encoder(const std::string& hierarchy_file, int n_classes)
{
    if (hierarchy_file.empty())
        return std::make_shared<OneHotEncoder>(n_classes);

    auto tree = std::make_shared<SoftmaxTree>(hierarchy_file);
    TORCH_CHECK(tree->size() == n_classes, "hierarchy tree has ", tree->size(),
        " nodes but ", n_classes, " classes are configured.");
    return tree;
}
