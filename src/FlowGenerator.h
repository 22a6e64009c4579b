#pragma once

#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "yaml_load.h"
#include "datasets.h"

struct FeedOptions
{
    std::string categories;
    std::string hierarchy;
    int img_input = 416;
    int shrink_factor = 32;
    int n_anchors = 5;
    int n_classes = 0;
    std::vector<float> multi_scale;
    int scale_interval = 10;
    int batch_size = 8;
    int scaling_factor = 5;
    bool augment = true;
    int seed = -1;

    static FeedOptions from_cfgs(const VariantConfigs& cfgs);
};

// 一次next()的输出
struct FeedBatch
{
    torch::Tensor images;           // [B, 3, H, W] float 0~1, RGB
    torch::Tensor targets;          // [B, H / shrink, W / shrink, n_anchors * (5 + C)]
    std::vector<int64_t> indices;   // 每个样本在原始数据列表中的位置
    int64_t step = 0;               // 第几个batch, 从0开始
    int img_size = 0;
    int grid_size = 0;
};

struct FeedStats
{
    int64_t batches = 0;
    int64_t epochs = 0;
    int64_t slices = 0;
    int64_t missing_images = 0;
    int64_t augmented = 0;
    int64_t rejected_augments = 0;
    int64_t boundary_drops = 0;     // 中心点落在网格边界外, label全为0
    int64_t dropped_tail = 0;       // 不足一个batch被丢弃的样本

    std::string show_info() const;
};

// 无限循环的数据流, 每个epoch打乱一次数据, 按batch_size切片,
// 每个切片展开(原图 + 增强)后再次打乱, 切成若干个batch输出
// 本身不是线程安全的, 多线程使用 ThreadSafeIter 包装
class FlowFromList
{
public:
    FlowFromList(std::vector<std::string> x, std::vector<LabelRecord> y, const FeedOptions& opts,
        const AugmentParams& hyp = AugmentParams());

    FeedBatch next();

    // 重新统计类别数量并生成增强数量, 只在调用方明确要求时执行
    void refresh_augment_plan();

    const FeedStats& stats() const { return feed_stats; }
    const std::map<std::string, int>& augment_plan() const { return builder->get_augment_level(); }
    const std::vector<std::string>& class_names() const { return names; }
    float current_scale() const { return multi_scale; }
    int slices_per_epoch() const { return slices; }
    int label_size() const { return builder->label_size(); }

private:
    void start_epoch();
    void load_slice(int i);
    FeedBatch make_batch(int z);

    std::vector<std::string> x;
    std::vector<LabelRecord> y;
    FeedOptions opts;
    std::vector<std::string> names;
    std::unique_ptr<SampleBuilder> builder;
    std::mt19937 gen;

    int slices = 0;
    std::vector<int> order;         // 当前epoch的打乱顺序
    int slice_idx = 0;
    float multi_scale = 1.0f;

    SampleSet current;              // 当前切片展开后的样本
    int sub_idx = 0;
    int num_sub = 0;
    int img_size = 0;
    int grid_size = 0;

    FeedStats feed_stats;
};

// Takes an iterator and makes it thread-safe by serializing calls to next().
template <typename Iter>
class ThreadSafeIter
{
public:
    using value_type = decltype(std::declval<Iter&>().next());

    explicit ThreadSafeIter(std::unique_ptr<Iter> _it) : it(std::move(_it)) {}

    ThreadSafeIter(const ThreadSafeIter&) = delete;
    ThreadSafeIter& operator=(const ThreadSafeIter&) = delete;

    value_type next()
    {
        std::lock_guard<std::mutex> lock(mtx);
        return it->next();
    }

    // 在同一把锁下访问内部状态
    template <typename F>
    auto with_locked(F&& f)
    {
        std::lock_guard<std::mutex> lock(mtx);
        return f(*it);
    }

private:
    std::unique_ptr<Iter> it;
    std::mutex mtx;
};

using ThreadSafeFlow = ThreadSafeIter<FlowFromList>;

std::shared_ptr<ThreadSafeFlow> flow_from_list(std::vector<std::string> x, std::vector<LabelRecord> y,
    const FeedOptions& opts, const AugmentParams& hyp = AugmentParams());
