#include "gpt_model.hpp"

#include <random>

using std::size_t;
using std::string;
using std::vector;

namespace {

bool ends_with(const string& s, const char* suffix) {
    const string suf(suffix);
    return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

// Shared by both named_parameters() overloads so the order is defined once.
template <typename Model, typename Visit>
void visit_parameters(Model& model, Visit&& visit) {
    visit("wte", model.Wte);
    visit("wpe", model.Wpe);
    for (size_t layer = 0; layer < model.blocks.size(); ++layer) {
        auto& block = model.blocks[layer];
        const string prefix = "blocks_" + std::to_string(layer) + "_";
        visit(prefix + "ln_1_g", block.ln1_gamma);
        visit(prefix + "ln_1_b", block.ln1_beta);
        for (size_t h = 0; h < block.attn.heads.size(); ++h) {
            auto& head = block.attn.heads[h];
            const string head_prefix = prefix + "attn_heads_" + std::to_string(h) + "_";
            visit(head_prefix + "q_w", head.Wq);
            visit(head_prefix + "k_w", head.Wk);
            visit(head_prefix + "v_w", head.Wv);
        }
        visit(prefix + "attn_c_proj_w", block.attn.Wproj);
        visit(prefix + "attn_c_proj_b", block.attn.bproj);
        visit(prefix + "ln_2_g", block.ln2_gamma);
        visit(prefix + "ln_2_b", block.ln2_beta);
        visit(prefix + "mlp_c_fc_w", block.ffn.W_fc);
        visit(prefix + "mlp_c_fc_b", block.ffn.b_fc);
        visit(prefix + "mlp_c_proj_w", block.ffn.W_proj);
        visit(prefix + "mlp_c_proj_b", block.ffn.b_proj);
    }
    visit("ln_f_g", model.ln_f_gamma);
    visit("ln_f_b", model.ln_f_beta);
    visit("lm_head_w", model.W_lm_head);
    visit("lm_head_b", model.b_lm_head);
}

}  // namespace

GPTModel::GPTModel(const ModelConfig& config, const std::uint32_t seed)
    : config_(config),
      Wte(Shape{config.vocab_size(), config.model_dim()}),
      Wpe(Shape{config.context_length(), config.model_dim()}),
      ln_f_gamma(Shape{config.model_dim()}, 1.0f),
      ln_f_beta(Shape{config.model_dim()}),
      W_lm_head(Shape{config.model_dim(), config.vocab_size()}),
      b_lm_head(Shape{config.vocab_size()})
{
    blocks.reserve(config.num_blocks());
    for (size_t layer = 0; layer < config.num_blocks(); ++layer) {
        blocks.emplace_back(config.model_dim(), config.num_heads(), config.dropout());
    }

    // Norm scales/shifts keep their 1/0 defaults, biases stay zero
    std::mt19937 rng(seed);
    std::normal_distribution<float> normal(0.0f, 0.02f);
    for (auto& named : named_parameters()) {
        if (ends_with(named.first, "_g") || ends_with(named.first, "_b")) {
            continue;
        }
        Tensor& W = *named.second;
        for (size_t i = 0; i < W.numel(); ++i) {
            W[i] = normal(rng);
        }
    }
}

Tensor GPTModel::forward(const IndexTensor& idx, const ExecutionMode& mode) const {
    if (idx.rank() != 2 || idx.dim(0) == 0 || idx.dim(1) == 0) {
        throw ShapeError("GPTModel: expected non-empty (B, T) indices, got " +
                         shape_to_string(idx.shape()));
    }
    const size_t B      = idx.dim(0);
    const size_t T      = idx.dim(1);
    const size_t n_embd = config_.model_dim();
    if (T > config_.context_length()) {
        throw ShapeError("GPTModel: sequence length " + std::to_string(T) +
                         " exceeds context_length " + std::to_string(config_.context_length()));
    }

    // Tables are reachable through named_parameters(), so check them before indexing raw storage
    expect_shape(Wte, 2, n_embd, "GPTModel token embedding");
    expect_shape(Wpe, 2, n_embd, "GPTModel positional embedding");
    if (Wte.dim(0) != config_.vocab_size()) {
        throw ShapeError("GPTModel: token embedding has " + std::to_string(Wte.dim(0)) +
                         " rows, vocab_size is " + std::to_string(config_.vocab_size()));
    }
    if (Wpe.dim(0) < T) {
        throw ShapeError("GPTModel: positional embedding has " + std::to_string(Wpe.dim(0)) +
                         " rows, sequence length is " + std::to_string(T));
    }

    // 1) Token + positional embeddings: x = Wte[idx] + Wpe[position]
    Tensor x(Shape{B, T, n_embd});
    for (size_t b = 0; b < B; ++b) {
        for (size_t t = 0; t < T; ++t) {
            const int tid = idx[b * T + t];
            if (tid < 0 || static_cast<size_t>(tid) >= config_.vocab_size()) {
                throw IndexError("Token ID " + std::to_string(tid) + " out of range [0, " +
                                 std::to_string(config_.vocab_size()) + ")");
            }
            const float* te = Wte.data() + static_cast<size_t>(tid) * n_embd;
            const float* pe = Wpe.data() + t * n_embd;
            float* out = x.data() + (b * T + t) * n_embd;
            for (size_t j = 0; j < n_embd; ++j) {
                out[j] = te[j] + pe[j];
            }
        }
    }

    // 2) Transformer blocks
    for (const TransformerBlock& block : blocks) {
        x = block.forward(x, mode);
    }

    // 3) Final layer norm
    x = layer_norm(x, ln_f_gamma, ln_f_beta);

    // 4) Output logits: (B, T, vocab_size)
    return linear(x, W_lm_head, b_lm_head);
}

Tensor GPTModel::forward(const IndexTensor& idx) const {
    return forward(idx, ExecutionMode::inference());
}

vector<std::pair<string, Tensor*>> GPTModel::named_parameters() {
    vector<std::pair<string, Tensor*>> params;
    visit_parameters(*this, [&](const string& name, Tensor& t) {
        params.emplace_back(name, &t);
    });
    return params;
}

vector<std::pair<string, const Tensor*>> GPTModel::named_parameters() const {
    vector<std::pair<string, const Tensor*>> params;
    visit_parameters(*this, [&](const string& name, const Tensor& t) {
        params.emplace_back(name, &t);
    });
    return params;
}

size_t GPTModel::parameter_count() const {
    size_t n = 0;
    for (const auto& named : named_parameters()) {
        n += named.second->numel();
    }
    return n;
}
