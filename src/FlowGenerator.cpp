#include "FlowGenerator.h"
#include "detect_grid.h"
#include "utils.h"

#include <sstream>

FeedOptions FeedOptions::from_cfgs(const VariantConfigs& cfgs)
{
    FeedOptions o;
    o.categories = get_cfg_string(cfgs, "categories");
    o.hierarchy = get_cfg_string(cfgs, "hierarchy");
    o.img_input = get_cfg_int(cfgs, "img_input");
    o.shrink_factor = get_cfg_int(cfgs, "shrink_factor");
    o.n_anchors = get_cfg_int(cfgs, "n_anchors");
    o.n_classes = get_cfg_int(cfgs, "n_classes");
    o.multi_scale = get_cfg_floats(cfgs, "multi_scale");
    o.scale_interval = get_cfg_int(cfgs, "scale_interval");
    o.batch_size = get_cfg_int(cfgs, "batch_size");
    o.scaling_factor = get_cfg_int(cfgs, "scaling_factor");
    o.augment = get_cfg_bool(cfgs, "augment");
    o.seed = get_cfg_int(cfgs, "seed");

    TORCH_CHECK(o.batch_size > 0, "batch_size must be positive, got ", o.batch_size);
    TORCH_CHECK(o.img_input > 0 && o.shrink_factor > 0 && o.img_input >= o.shrink_factor,
        "img_input ", o.img_input, " / shrink_factor ", o.shrink_factor, " not right.");
    TORCH_CHECK(o.n_anchors > 0, "n_anchors must be positive, got ", o.n_anchors);
    TORCH_CHECK(o.scale_interval > 0, "scale_interval must be positive, got ", o.scale_interval);
    TORCH_CHECK(o.scaling_factor >= 0, "scaling_factor must not be negative, got ", o.scaling_factor);
    TORCH_CHECK(!o.multi_scale.empty(), "multi_scale must not be empty.");
    for (float s : o.multi_scale)
    {
        TORCH_CHECK(s > 0.f, "multi_scale factor ", s, " must be positive.");
        int size = scaled_input_size(o.img_input, s);
        TORCH_CHECK(size >= o.shrink_factor, "multi_scale factor ", s, " gives input ", size,
            " smaller than shrink_factor ", o.shrink_factor);
        if (size % o.shrink_factor != 0)
            LOG(WARNING) << "multi_scale " << s << " -> input " << size << " not a multiple of "
                << o.shrink_factor << ", grid will be truncated.";
    }
    if (o.img_input % o.shrink_factor != 0)
        LOG(WARNING) << "img_input " << o.img_input << " not a multiple of " << o.shrink_factor;
    return o;
}

std::string FeedStats::show_info() const
{
    std::stringstream ss;
    ss << "batches: " << batches << " epochs: " << epochs << " slices: " << slices
        << " missing: " << missing_images << " augmented: " << augmented
        << " rejected: " << rejected_augments << " boundary drops: " << boundary_drops
        << " dropped tail: " << dropped_tail;
    return ss.str();
}

FlowFromList::FlowFromList(std::vector<std::string> _x, std::vector<LabelRecord> _y, const FeedOptions& _opts,
    const AugmentParams& hyp)
    : x(std::move(_x)), y(std::move(_y)), opts(_opts), gen(make_generator(_opts.seed))
{
    TORCH_CHECK(x.size() == y.size(), "image list (", x.size(), ") and label list (", y.size(), ") not match.");
    TORCH_CHECK(!x.empty(), "empty dataset.");
    TORCH_CHECK(opts.batch_size > 0 && size_t(opts.batch_size) <= x.size(), "batch_size ", opts.batch_size,
        " must be in [1, ", x.size(), "], otherwise no batch can be produced.");
    check_single_box_per_image(x);

    // Get list of classes
    names = load_categories(opts.categories);
    if (opts.n_classes == 0)
        opts.n_classes = static_cast<int>(names.size());
    TORCH_CHECK(opts.n_classes == int(names.size()), "n_classes ", opts.n_classes,
        " but categories file has ", names.size(), " names.");
    for (const auto& record : y)
    {
        TORCH_CHECK(check_str_in_strs(names, record.name), "label ", record.name,
            " not found in ", opts.categories);
    }

    auto encoder = make_label_encoder(opts.hierarchy, opts.n_classes);
    // 类别序号直接作为tree的节点序号, 两个文件的顺序必须一致
    if (auto tree = std::dynamic_pointer_cast<SoftmaxTree>(encoder))
    {
        for (size_t i = 0; i < names.size(); i++)
        {
            TORCH_CHECK(tree->names()[i] == names[i], "hierarchy node ", i, " is ", tree->names()[i],
                " but category ", i, " is ", names[i], ", ", opts.hierarchy, " must follow the order of ",
                opts.categories);
        }
    }
    builder = std::make_unique<SampleBuilder>(names, encoder, opts.img_input, opts.augment, hyp);

    slices = static_cast<int>(x.size()) / opts.batch_size;
    slice_idx = slices;     // 第一次next()时开始新的epoch
    img_size = opts.img_input;
    grid_size = img_size / opts.shrink_factor;

    // (less data / class means more augmentation)
    if (opts.augment)
        refresh_augment_plan();

    LOG(INFO) << "flow_from_list: " << x.size() << " images, " << names.size() << " classes ("
        << encoder->getname() << "), batch " << opts.batch_size << ", " << slices << " slices per epoch";
}

void FlowFromList::refresh_augment_plan()
{
    auto level = calc_augment_level(y, opts.scaling_factor);
    for (const auto& [name, n] : level)
        VLOG(1) << "augment level " << name << ": " << n;
    builder->set_augment_level(level);
}

void FlowFromList::start_epoch()
{
    // Shuffle DATA to avoid over-fitting
    order = random_queue(static_cast<int>(x.size()), gen);
    slice_idx = 0;
    feed_stats.epochs++;
}

void FlowFromList::load_slice(int i)
{
    if (i % opts.scale_interval == 0 && opts.augment)
    {
        int pick = random_int(gen, 0, static_cast<int>(opts.multi_scale.size()) - 1);
        multi_scale = opts.multi_scale[pick];
        VLOG(1) << "Multi-scale updated to " << multi_scale;
    }

    std::vector<std::string> f_name;
    std::vector<LabelRecord> labels;
    std::vector<int64_t> src_indices;
    for (int k = i * opts.batch_size; k < (i + 1) * opts.batch_size; k++)
    {
        f_name.push_back(x[order[k]]);
        labels.push_back(y[order[k]]);
        src_indices.push_back(order[k]);
    }

    current = builder->build(f_name, labels, src_indices, multi_scale, gen);
    feed_stats.slices++;
    feed_stats.missing_images += current.missing;
    feed_stats.augmented += current.augmented;
    feed_stats.rejected_augments += current.rejected;

    // Shuffle X, Y again
    current.shuffle(gen);

    img_size = opts.augment ? scaled_input_size(opts.img_input, multi_scale) : opts.img_input;
    grid_size = img_size / opts.shrink_factor;
    num_sub = static_cast<int>(current.size()) / opts.batch_size;
    feed_stats.dropped_tail += static_cast<int64_t>(current.size()) % opts.batch_size;
    sub_idx = 0;
}

FeedBatch FlowFromList::make_batch(int z)
{
    int bs = opts.batch_size;
    std::vector<torch::Tensor> imgs(current.images.begin() + z * bs, current.images.begin() + (z + 1) * bs);
    std::vector<torch::Tensor> labels(current.labels.begin() + z * bs, current.labels.begin() + (z + 1) * bs);

    FeedBatch batch;
    batch.images = torch::stack(imgs, 0);
    auto [targets, dropped] = encode_detect_grid(torch::stack(labels, 0), grid_size, grid_size, opts.n_anchors);
    batch.targets = targets;
    batch.indices.assign(current.indices.begin() + z * bs, current.indices.begin() + (z + 1) * bs);
    batch.step = feed_stats.batches++;
    batch.img_size = img_size;
    batch.grid_size = grid_size;
    feed_stats.boundary_drops += dropped;
    return batch;
}

FeedBatch FlowFromList::next()
{
    int empty_slices = 0;
    while (sub_idx >= num_sub)
    {
        if (slice_idx >= slices)
            start_epoch();
        load_slice(slice_idx++);
        if (num_sub == 0)
        {
            // 整个epoch都没有输出, 继续循环只会卡死
            TORCH_CHECK(++empty_slices <= slices, "a whole epoch produced no batch, ",
                feed_stats.missing_images, " images missing so far.");
        }
    }
    return make_batch(sub_idx++);
}

std::shared_ptr<ThreadSafeFlow> flow_from_list(std::vector<std::string> x, std::vector<LabelRecord> y,
    const FeedOptions& opts, const AugmentParams& hyp)
{
    auto it = std::make_unique<FlowFromList>(std::move(x), std::move(y), opts, hyp);
    return std::make_shared<ThreadSafeFlow>(std::move(it));
}
