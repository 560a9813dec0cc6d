#include "onnx_session.h"
#include "errors.h"
#include <numeric>
#include <spdlog/spdlog.h>

Ort::Env &OrtEnvHolder::Get() {
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "lineocr");
    return env; // 单例：程序全程只创建一次
}

OnnxSession::OnnxSession(const std::filesystem::path &model_path, bool use_cuda, int intra_threads) {
    if (!std::filesystem::is_regular_file(model_path))
        throw ConfigurationError("missing model file " + model_path.string());

    Ort::SessionOptions opt;
    opt.SetIntraOpNumThreads(intra_threads);
    opt.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

    // GPU：优先 CUDA，不可用时回退 CPU
    if (use_cuda) {
        try {
            OrtCUDAProviderOptions cuda_opts{};
            opt.AppendExecutionProvider_CUDA(cuda_opts);
        } catch (const Ort::Exception &e) {
            spdlog::warn("CUDA not available - defaulting to CPU ({})", e.what());
        }
    }

    try {
        session_ = Ort::Session(OrtEnvHolder::Get(), model_path.c_str(), opt);
    } catch (const Ort::Exception &e) {
        throw ConfigurationError("cannot load model " + model_path.string() + ": " + e.what());
    }

    // 初始化输入输出的名称和形状信息
    size_t in_cnt = session_.GetInputCount();
    size_t out_cnt = session_.GetOutputCount();

    input_names_.resize(in_cnt);
    output_names_.resize(out_cnt);
    input_shapes_.resize(in_cnt);

    for (size_t i = 0; i < in_cnt; ++i) {
        auto nm = session_.GetInputNameAllocated(i, allocator_);
        input_names_[i] = nm.get();
        Ort::TypeInfo type_info = session_.GetInputTypeInfo(i);
        auto info = type_info.GetTensorTypeAndShapeInfo();
        auto shp = info.GetShape();
        for (auto &d: shp) {
            if (d == 0) d = -1;
        }
        input_shapes_[i] = std::move(shp);
    }
    for (size_t i = 0; i < out_cnt; ++i) {
        auto nm = session_.GetOutputNameAllocated(i, allocator_);
        output_names_[i] = nm.get();
    }
    spdlog::info("loaded {} ({} inputs, {} outputs)", model_path.filename().string(), in_cnt, out_cnt);
}

Ort::Value OnnxSession::run(float *data, const std::vector<int64_t> &shape) const {
    size_t count = std::accumulate(shape.begin(), shape.end(), (size_t) 1,
                                   [](size_t a, int64_t d) { return a * (size_t) d; });
    try {
        auto mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);
        auto input = Ort::Value::CreateTensor<float>(mem, data, count, shape.data(), shape.size());
        std::vector<const char *> in{input_names_[0].c_str()};
        std::vector<const char *> out{output_names_[0].c_str()};
        auto outputs = session_.Run(Ort::RunOptions{nullptr}, in.data(), &input, 1, out.data(), 1);
        return std::move(outputs[0]);
    } catch (const Ort::Exception &e) {
        throw OracleFailure(std::string("onnxruntime: ") + e.what());
    }
}
