#pragma once

#include <memory>
#include <string>
#include <vector>

#include <torch/torch.h>

// 类别编码, 输入类别序号, 输出固定长度的编码向量
// 所有的编码器都继承自这个类, 后期好进行扩展
class LabelEncoder
{
public:
    virtual ~LabelEncoder() = default;

    virtual torch::Tensor encode_label(int index) const = 0;
    virtual int size() const = 0;
    virtual std::string getname() const = 0;
};

class OneHotEncoder : public LabelEncoder
{
public:
    explicit OneHotEncoder(int n_classes);

    torch::Tensor encode_label(int index) const override;
    int size() const override { return n; }
    std::string getname() const override { return "one_hot"; }
private:
    int n;
};

// darknet格式的tree文件, 每行 "name parent_index", parent为-1表示根节点
// 节点顺序与categories文件中的类别顺序一致
class SoftmaxTree : public LabelEncoder
{
public:
    explicit SoftmaxTree(const std::string& tree_file);

    // 将当前节点以及所有的父节点置1
    torch::Tensor encode_label(int index) const override;
    int size() const override { return static_cast<int>(parent.size()); }
    std::string getname() const override { return "softmax_tree"; }

    const std::vector<std::string>& names() const { return name; }
    const std::vector<int>& parents() const { return parent; }
    bool is_leaf(int index) const { return leaf[index]; }
    int groups() const { return static_cast<int>(group_size.size()); }
private:
    std::vector<std::string> name;
    std::vector<int> parent;
    std::vector<bool> leaf;
    std::vector<int> group_size;    // 同一个parent的连续节点为一个group
};

// hierarchy_file为空时返回OneHotEncoder
std::shared_ptr<LabelEncoder> make_label_encoder(const std::string& hierarchy_file, int n_classes);
