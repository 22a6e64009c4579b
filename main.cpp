#include <filesystem>
#include <atomic>
#include <thread>
#include <vector>

#include <torch/torch.h>
#include <opencv2/opencv.hpp>

#define GLOG_USE_GLOG_EXPORT

#include "gflags/gflags.h"
#include "glog/logging.h"

#include "yaml_load.h"
#include "utils.h"
#include "utils/general.h"
#include "datasets.h"
#include "detect_grid.h"
#include "FlowGenerator.h"

// 命令行参数只在显式指定时覆盖yaml中的设置
DEFINE_string(cfg,          "cfgs/default.yaml",    "feed config yaml path");
DEFINE_string(data,         "",                     "annotation list: path,x1,y1,x2,y2,class_name");
DEFINE_string(categories,   "",                     "class names, one per line");
DEFINE_string(hierarchy,    "",                     "darknet style tree file, empty for one-hot");
DEFINE_int32(batch_size,    8,                      "images per batch");
DEFINE_int32(img_size,      416,                    "canonical input size");
DEFINE_bool(augment,        true,                   "enable balance augmentation and multi-scale");
DEFINE_int32(seed,          -1,                     "random seed, <0 for nondeterministic");
DEFINE_int32(workers,       2,                      "number of consumer threads");
DEFINE_int32(batches,       20,                     "total batches to pull before exit");
DEFINE_string(project,      "runs/feed",            "save effective config to project/name");
DEFINE_string(name,         "exp",                  "save effective config to project/name");
DEFINE_bool(save_cfg,       false,                  "save the effective config yaml");

namespace {
bool flag_set(const char* name)
{
    return !google::GetCommandLineFlagInfoOrDie(name).is_default;
}
}

void parse_args(VariantConfigs& args)
{
    if (flag_set("data"))       args["data"] = FLAGS_data;
    if (flag_set("categories")) args["categories"] = FLAGS_categories;
    if (flag_set("hierarchy"))  args["hierarchy"] = FLAGS_hierarchy;
    if (flag_set("batch_size")) args["batch_size"] = FLAGS_batch_size;
    if (flag_set("img_size"))   args["img_input"] = FLAGS_img_size;
    if (flag_set("augment"))    args["augment"] = FLAGS_augment;
    if (flag_set("seed"))       args["seed"] = FLAGS_seed;
}

int main(int argc, char* argv[])
{
    google::ParseCommandLineFlags(&argc, &argv, false);
    ::google::InitGoogleLogging(argv[0]);
    FLAGS_alsologtostderr = true;

    std::string root_path = get_root_path_string();
    auto to_root = [&](const std::string& p) {
        if (p.empty() || std::filesystem::path(p).is_absolute())
            return p;
        return std::filesystem::path(root_path).append(p).string();
    };

    VariantConfigs args, hyps;
    load_default_environment(to_root(FLAGS_cfg), args, hyps);
    parse_args(args);
    args["data"] = to_root(std::get<std::string>(args["data"]));
    args["categories"] = to_root(std::get<std::string>(args["categories"]));
    args["hierarchy"] = to_root(std::get<std::string>(args["hierarchy"]));

    show_cfg_info("feed", args);
    show_cfg_info("hyp", hyps);

    std::shared_ptr<ThreadSafeFlow> flow;
    int n_anchors = 0;
    try {
        auto opts = FeedOptions::from_cfgs(args);
        auto hyp = AugmentParams::from_cfgs(hyps);
        n_anchors = opts.n_anchors;

        std::vector<std::string> x;
        std::vector<LabelRecord> y;
        std::string sep = get_cfg_string(args, "separator");
        load_dataset(get_cfg_string(args, "data"), sep.empty() ? ',' : sep[0], x, y);
        flow = flow_from_list(std::move(x), std::move(y), opts, hyp);
    }
    catch (const c10::Error& e)
    {
        LOG(ERROR) << e.what_without_backtrace();
        return EXIT_FAILURE;
    }

    flow->with_locked([](FlowFromList& f) {
        for (const auto& [name, n] : f.augment_plan())
            LOG(INFO) << "augment level " << std::setw(20) << std::left << name << n;
        return 0;
    });

    if (FLAGS_save_cfg)
    {
        auto save_dir = increment_path(std::filesystem::path(root_path).append(FLAGS_project).append(FLAGS_name).string(), false);
        std::filesystem::create_directories(save_dir);
        save_cfg_yaml(args, std::filesystem::path(save_dir).append("feed.yaml").string());
        save_cfg_yaml(hyps, std::filesystem::path(save_dir).append("hyp.yaml").string());
        std::cout << ColorString("save dir: ", "info") << save_dir << "\n";
    }

    std::atomic<int> remaining(FLAGS_batches);
    std::atomic<bool> failed(false);
    auto worker = [&](int id) {
        while (remaining.fetch_sub(1) > 0 && !failed)
        {
            try {
                auto batch = flow->next();
                auto objs = decode_detect_grid(batch.targets, n_anchors);
                LOG(INFO) << "worker " << id << " step " << batch.step
                    << " images " << batch.images.sizes()
                    << " targets " << batch.targets.sizes()
                    << " objects " << objs.size(0);
            }
            catch (const c10::Error& e)
            {
                LOG(ERROR) << "worker " << id << ": " << e.what_without_backtrace();
                failed = true;
            }
        }
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < std::max(1, FLAGS_workers); i++)
        threads.emplace_back(worker, i);
    for (auto& t : threads)
        t.join();

    auto stats = flow->with_locked([](FlowFromList& f) { return f.stats(); });
    std::cout << ColorString("feed stats: ", "G") << stats.show_info() << std::endl;

    google::ShutdownGoogleLogging();
    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
