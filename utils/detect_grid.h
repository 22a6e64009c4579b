#pragma once

#include <tuple>

#include <torch/torch.h>

// labels: [B, 5 + C], 每行 [xc, yc, w, h, obj, class encoding...], 相对坐标
// 返回 [B, grid_h, grid_w, n_anchors * (5 + C)] 以及因落在边界上被丢弃的样本数
//
// 每个样本只在中心点所在的格子 (c = floor(yc * grid_h), r = floor(xc * grid_w)) 写入,
// 该格子内的所有 anchor 写入相同的数据, obj = 1.
// 中心点正好在 1.0 时 r == grid_w, 该样本不写入(与训练端保持一致, 不做修正)
std::tuple<torch::Tensor, int> encode_detect_grid(const torch::Tensor& labels,
    int grid_h, int grid_w, int n_anchors);

// encode_detect_grid 的逆过程, 读出所有 obj > 0 的 anchor
// 返回 [N, 4 + 5 + C]: batch, row(c), col(r), anchor, xc, yc, w, h, obj, class encoding...
torch::Tensor decode_detect_grid(const torch::Tensor& targets, int n_anchors);
