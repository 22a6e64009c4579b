#include "detect_grid.h"

#include <cmath>

std::tuple<torch::Tensor, int> encode_detect_grid(const torch::Tensor& labels,
    int grid_h, int grid_w, int n_anchors)
{
    TORCH_CHECK(labels.dim() == 2 && labels.size(1) > 5, "labels shape expected [B, 5 + C] but is ", labels.sizes());
    TORCH_CHECK(grid_h > 0 && grid_w > 0 && n_anchors > 0, "grid ", grid_h, "x", grid_w,
        " with ", n_anchors, " anchors not right.");

    auto labels_f = labels.to(torch::kFloat32).contiguous();
    int64_t batch_size = labels_f.size(0);
    int64_t depth = labels_f.size(1);

    // Construct detection mask
    auto y_batch = torch::zeros({ batch_size, grid_h, grid_w, n_anchors, depth }, torch::kFloat32);
    auto acc = labels_f.accessor<float, 2>();

    int dropped = 0;
    for (int64_t b = 0; b < batch_size; b++)
    {
        // Find the grid cell where the centroid of ground truth locates
        int r = static_cast<int>(std::floor(acc[b][0] * grid_w));
        int c = static_cast<int>(std::floor(acc[b][1] * grid_h));
        if (r < 0 || c < 0 || r >= grid_w || c >= grid_h)
        {
            dropped++;
            continue;
        }

        // 一个样本只有一个格子有数据, 所有anchor相同
        auto cell = labels_f[b].unsqueeze(0).expand({ n_anchors, depth }).clone();
        cell.index_put_({ torch::indexing::Slice(), 4 }, 1.0f);
        y_batch.index_put_({ b, c, r }, cell);
    }

    return { y_batch.reshape({ batch_size, grid_h, grid_w, n_anchors * depth }), dropped };
}

torch::Tensor decode_detect_grid(const torch::Tensor& targets, int n_anchors)
{
    TORCH_CHECK(targets.dim() == 4 && targets.size(3) % n_anchors == 0,
        "targets shape expected [B, gh, gw, A * (5 + C)] but is ", targets.sizes());

    int64_t depth = targets.size(3) / n_anchors;
    auto t = targets.reshape({ targets.size(0), targets.size(1), targets.size(2), n_anchors, depth });
    auto obj = t.index({ "...", 4 }) > 0;
    auto pos = torch::nonzero(obj);                 // [N, 4]: b, c, r, a
    auto values = t.index({ obj });                 // [N, depth]
    return torch::cat({ pos.to(torch::kFloat32), values }, 1);
}
