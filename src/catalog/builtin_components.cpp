#include "component_catalog.hpp"
#include <limits>

namespace component_catalog {

namespace {

Component make(Category category, std::string name, std::string latex, std::string ascii,
               std::string description, std::vector<Stage> stages, std::string time_cost,
               std::string space_cost) {
    Component c;
    c.category = category;
    c.name = std::move(name);
    c.formula_latex = std::move(latex);
    c.formula_ascii = std::move(ascii);
    c.description = std::move(description);
    c.valid_stages = std::move(stages);
    c.time_cost = std::move(time_cost);
    c.space_cost = std::move(space_cost);
    return c;
}

ParamRange range(std::string name, std::vector<ParamValue> values) {
    return {std::move(name), std::move(values)};
}

std::vector<ParamValue> int_range(int first, int last) {
    std::vector<ParamValue> values;
    for (int i = first; i <= last; ++i) values.emplace_back(i);
    return values;
}

constexpr Stage S0 = Stage::PreFilter;
constexpr Stage S1 = Stage::Transform;
constexpr Stage S2 = Stage::Modeling;
constexpr Stage S3 = Stage::EntropyCoding;

void add_entropy_measures(std::vector<Component>& out) {
    auto c = make(Category::EntropyMeasure, "Shannon Entropy",
                  R"tex(H(X) = -\sum_{i=1}^{n} p(x_i) \log_2 p(x_i))tex",
                  "H(X) = -SUM(p(x_i) * log2(p(x_i))) for i=1 to n",
                  "Fundamental measure of information content; theoretical minimum bits per symbol",
                  {S0}, "O(n)", "O(n)");
    c.parameters = {{"n", "alphabet size"}, {"p(x_i)", "probability of symbol i"}};
    c.parameter_ranges = {range("base", {2, "e", 10})};
    out.push_back(std::move(c));

    c = make(Category::EntropyMeasure, "Conditional Entropy",
             R"tex(H(X|Y) = -\sum_{y} p(y) \sum_{x} p(x|y) \log_2 p(x|y))tex",
             "H(X|Y) = -SUM_y(p(y) * SUM_x(p(x|y) * log2(p(x|y))))",
             "Expected entropy of X given knowledge of Y; basis for context modeling",
             {S0}, "O(|X| * |Y|)", "O(|X| * |Y|)");
    c.parameters = {{"X", "target variable"}, {"Y", "conditioning variable"}};
    out.push_back(std::move(c));

    c = make(Category::EntropyMeasure, "Mutual Information",
             R"tex(I(X;Y) = H(X) - H(X|Y) = \sum_{x,y} p(x,y) \log_2 \frac{p(x,y)}{p(x)p(y)})tex",
             "I(X;Y) = H(X) - H(X|Y) = SUM(p(x,y) * log2(p(x,y) / (p(x)*p(y))))",
             "Information shared between two variables; guides context selection",
             {S0}, "O(|X| * |Y|)", "O(|X| * |Y|)");
    c.parameters = {{"X", "first variable"}, {"Y", "second variable"}};
    out.push_back(std::move(c));

    c = make(Category::EntropyMeasure, "Kolmogorov Complexity",
             R"tex(K(x) = \min\{|p| : U(p) = x\})tex",
             "K(x) = min{|p| : U(p) = x} (length of shortest program)",
             "Theoretical minimum description length; incomputable but guides algorithm design",
             {S0}, "Incomputable", "Incomputable");
    c.parameters = {{"U", "universal Turing machine"}, {"p", "program"}};
    out.push_back(std::move(c));

    c = make(Category::EntropyMeasure, "Rényi Entropy",
             R"tex(H_\alpha(X) = \frac{1}{1-\alpha} \log_2 \sum_{i=1}^{n} p_i^\alpha)tex",
             "H_alpha(X) = (1/(1-alpha)) * log2(SUM(p_i^alpha))",
             "Generalized entropy; alpha=1 gives Shannon entropy, alpha=0 gives Hartley entropy",
             {S0}, "O(n)", "O(n)");
    c.parameters = {{"alpha", "order parameter (α ≥ 0, α ≠ 1)"}};
    c.parameter_ranges = {range("alpha", {0, 0.5, 2, std::numeric_limits<double>::infinity()})};
    out.push_back(std::move(c));
}

void add_transforms(std::vector<Component>& out) {
    auto c = make(Category::Transform, "Burrows-Wheeler Transform",
                  R"tex(BWT(s) = L \text{ where } M = \text{sort}(\text{rotations}(s)), L = \text{last\_column}(M))tex",
                  "BWT(s) = last_column(sort(all_rotations(s)))",
                  "Reversible transform that groups similar contexts together; basis for bzip2",
                  {S1}, "O(n log n)", "O(n)");
    c.parameters = {{"s", "input string"}};
    out.push_back(std::move(c));

    c = make(Category::Transform, "Move-to-Front Transform",
             R"tex(MTF(s_i) = \text{position of } s_i \text{ in list } L; \text{ move } s_i \text{ to front})tex",
             "MTF(s_i) = index_of(s_i, L); then move s_i to L[0]",
             "Exploits locality by outputting small numbers for recently-seen symbols",
             {S2}, "O(n * |Σ|)", "O(|Σ|)");
    c.parameters = {{"alphabet_size", "size of symbol alphabet"}};
    c.parameter_ranges = {range("alphabet_size", {256, 65536})};
    c.prerequisites = {"Burrows-Wheeler Transform"};
    out.push_back(std::move(c));

    // Lossless on its own; quantization is what makes DCT codecs lossy.
    c = make(Category::Transform, "Discrete Cosine Transform",
             R"tex(X_k = \sum_{n=0}^{N-1} x_n \cos\left[\frac{\pi}{N}\left(n+\frac{1}{2}\right)k\right])tex",
             "X_k = SUM(x_n * cos(pi/N * (n + 0.5) * k)) for n=0 to N-1",
             "Frequency-domain transform; used in JPEG (lossy variant exists)",
             {S1}, "O(n log n)", "O(n)");
    c.parameters = {{"N", "block size"}};
    c.parameter_ranges = {range("N", {8, 16, 32})};
    out.push_back(std::move(c));

    c = make(Category::Transform, "Delta Encoding",
             R"tex(\Delta_i = x_i - x_{i-1}, \quad x_0' = x_0)tex",
             "delta_i = x_i - x_{i-1}; x_0' = x_0",
             "Stores differences between consecutive values; effective for sorted/smooth data",
             {S1}, "O(n)", "O(1)");
    c.parameters = {{"order", "delta order (1=first difference, 2=second difference)"}};
    c.parameter_ranges = {range("order", {1, 2, 3})};
    out.push_back(std::move(c));

    c = make(Category::Transform, "XOR Delta",
             R"tex(d_i = x_i \oplus x_{i-1})tex",
             "d_i = x_i XOR x_{i-1}",
             "Bitwise delta; preserves structure in binary data with similar consecutive values",
             {S1}, "O(n)", "O(1)");
    out.push_back(std::move(c));

    c = make(Category::Transform, "Integer Wavelet Transform (Lifting)",
             R"tex(d_j[n] = x[2n+1] - \lfloor(x[2n] + x[2n+2])/2\rfloor; \quad s_j[n] = x[2n] + \lfloor d_j[n]/4 \rfloor)tex",
             "d_j[n] = x[2n+1] - floor((x[2n] + x[2n+2])/2); s_j[n] = x[2n] + floor(d_j[n]/4)",
             "Lossless wavelet via integer lifting scheme; used in JPEG 2000 lossless mode",
             {S1}, "O(n)", "O(n)");
    c.parameters = {{"levels", "decomposition levels"}};
    c.parameter_ranges = {range("levels", {1, 2, 3, 4})};
    out.push_back(std::move(c));

    c = make(Category::Transform, "Byte Pair Encoding (Transform)",
             R"tex(BPE(s) = \text{replace most frequent pair } (a,b) \text{ with new symbol } c)tex",
             "BPE(s) = iteratively_replace(most_frequent_pair, new_symbol)",
             "Iteratively replaces frequent byte pairs; creates implicit dictionary",
             {S1}, "O(n * iterations)", "O(|vocab|)");
    c.parameters = {{"max_iterations", "maximum replacement iterations"}};
    c.parameter_ranges = {range("max_iterations", {100, 1000, 10000})};
    out.push_back(std::move(c));
}

void add_predictors(std::vector<Component>& out) {
    auto c = make(Category::Predictor, "Order-N Markov Predictor",
                  R"tex(P(x_i | x_{i-1}, ..., x_{i-n}) = \frac{C(x_{i-n}...x_i)}{C(x_{i-n}...x_{i-1})})tex",
                  "P(x_i | context) = count(context + x_i) / count(context)",
                  "Predicts next symbol based on preceding n symbols; basis for PPM",
                  {S2}, "O(n)", "O(|Σ|^order)");
    c.parameters = {{"order", "context length n"}};
    c.parameter_ranges = {range("order", int_range(0, 6))};
    out.push_back(std::move(c));

    c = make(Category::Predictor, "Prediction by Partial Matching (PPM)",
             R"tex(P(x) = \lambda_n P_n(x) + (1-\lambda_n)[\lambda_{n-1} P_{n-1}(x) + ...])tex",
             "P(x) = weighted_blend(P_order_n(x), P_order_n-1(x), ..., P_order_0(x))",
             "Blends predictions from multiple context orders with escape mechanism",
             {S2}, "O(n * max_order)", "O(|Σ|^max_order)");
    c.parameters = {{"max_order", "maximum context order"}, {"escape", "escape method"}};
    c.parameter_ranges = {range("max_order", {4, 5, 6, 8}),
                          range("escape", {"PPMA", "PPMB", "PPMC", "PPMD", "PPMD+"})};
    out.push_back(std::move(c));

    c = make(Category::Predictor, "Dynamic Markov Compression (DMC)",
             R"tex(P(b|state) = \frac{count(state, b) + 1}{count(state) + 2}; \text{ clone states adaptively})tex",
             "P(bit|state) = (count(state,bit) + 1) / (count(state) + 2); clone when threshold exceeded",
             "Bit-level Markov model that dynamically clones states",
             {S2}, "O(n)", "O(states)");
    c.parameters = {{"threshold", "cloning threshold"}};
    c.parameter_ranges = {range("threshold", {2, 4, 8, 16})};
    out.push_back(std::move(c));

    c = make(Category::Predictor, "Linear Predictor",
             R"tex(\hat{x}_i = \sum_{j=1}^{p} a_j x_{i-j})tex",
             "x_hat_i = SUM(a_j * x_{i-j}) for j=1 to p",
             "Linear combination of previous samples; used in FLAC, PNG",
             {S1, S2}, "O(n * p)", "O(p)");
    c.parameters = {{"order", "predictor order p"}, {"coefficients", "predictor coefficients"}};
    c.parameter_ranges = {range("order", {1, 2, 3, 4})};
    out.push_back(std::move(c));

    c = make(Category::Predictor, "PNG Predictors (Paeth)",
             R"tex(Paeth(a,b,c) = \text{argmin}_{x \in \{a,b,c\}} |x - (a+b-c)|)tex",
             "Paeth(left, above, upper_left) = closest_to(left + above - upper_left)",
             "2D predictor selecting from left/above/diagonal based on gradient",
             {S1}, "O(1) per pixel", "O(width)");
    out.push_back(std::move(c));

    c = make(Category::Predictor, "Context Tree Weighting (CTW)",
             R"tex(P_s = \frac{1}{2}P_e(s) + \frac{1}{2}P_{s0}P_{s1})tex",
             "P_s = 0.5 * P_estimated(s) + 0.5 * P_child0 * P_child1",
             "Bayesian mixture over all context tree depths; theoretically optimal",
             {S2}, "O(n * depth)", "O(2^depth)");
    c.parameters = {{"max_depth", "maximum tree depth"}};
    c.parameter_ranges = {range("max_depth", {8, 16, 24, 32, 48})};
    out.push_back(std::move(c));
}

void add_dictionary_methods(std::vector<Component>& out) {
    auto c = make(Category::Dictionary, "LZ77 (Sliding Window)",
                  R"tex((d, l, c) \text{ where } d = \text{distance}, l = \text{length}, c = \text{next char})tex",
                  "encode(match) = (distance_back, match_length, next_char)",
                  "Replace repeated sequences with back-references; basis for DEFLATE",
                  {S1, S2}, "O(n * window)", "O(window)");
    c.parameters = {{"window_size", "sliding window size"}, {"lookahead_size", "lookahead buffer size"}};
    c.parameter_ranges = {range("window_size", {4096, 8192, 32768, 65536}),
                          range("lookahead_size", {16, 32, 64, 256})};
    out.push_back(std::move(c));

    c = make(Category::Dictionary, "LZ78 (Explicit Dictionary)",
             R"tex((i, c) \text{ where } i = \text{dict index}, c = \text{extending char})tex",
             "encode(phrase) = (dictionary_index, extending_character)",
             "Builds explicit dictionary of phrases; basis for LZW",
             {S1, S2}, "O(n)", "O(dict_size)");
    c.parameters = {{"max_dict_size", "maximum dictionary entries"}};
    c.parameter_ranges = {range("max_dict_size", {4096, 16384, 65536})};
    out.push_back(std::move(c));

    c = make(Category::Dictionary, "LZW (Lempel-Ziv-Welch)",
             R"tex(\text{output } dict[w]; \text{ add } w+c \text{ to dict}; w = c)tex",
             "output(dict[w]); dict[next_index] = w + c; w = c",
             "Outputs only dictionary indices; used in GIF, early Unix compress",
             {S1, S2}, "O(n)", "O(2^max_bits)");
    c.parameters = {{"max_bits", "maximum code bits"}};
    c.parameter_ranges = {range("max_bits", {12, 14, 16})};
    out.push_back(std::move(c));

    c = make(Category::Dictionary, "LZSS (LZ77 + flags)",
             R"tex(\text{flag bit } + \begin{cases} \text{literal byte} & \text{if flag}=0 \\ (d, l) & \text{if flag}=1 \end{cases})tex",
             "flag_bit + (literal OR (distance, length))",
             "LZ77 variant with flag bits; more efficient for short matches",
             {S1, S2}, "O(n * window)", "O(window)");
    c.parameters = {{"min_match", "minimum match length"}};
    c.parameter_ranges = {range("min_match", {2, 3, 4})};
    out.push_back(std::move(c));

    c = make(Category::Dictionary, "LZMA (Lempel-Ziv-Markov chain)",
             R"tex(LZ77 + \text{range coder} + \text{context-dependent bit models})tex",
             "LZMA = LZ77_matches + range_coder(context_modeled_bits)",
             "LZ77 with range coding and sophisticated context modeling; used in 7z, xz",
             {S1, S2, S3}, "O(n)", "O(dict_size)");
    c.parameters = {{"dict_size", "dictionary size"},
                    {"lc", "literal context bits"},
                    {"lp", "literal position bits"},
                    {"pb", "position bits"}};
    c.parameter_ranges = {range("dict_size", {1 << 16, 1 << 20, 1 << 24, 1 << 26}),
                          range("lc", {3, 4}), range("lp", {0, 1, 2}), range("pb", {0, 1, 2})};
    out.push_back(std::move(c));

    c = make(Category::Dictionary, "LZ4 (Fast LZ)",
             R"tex(\text{token} = (lit\_len : 4, match\_len : 4) + \text{literals} + \text{offset})tex",
             "token = (literal_length:4bits, match_length:4bits) + literals + offset16",
             "Extremely fast LZ77 variant optimized for decompression speed",
             {S1, S2}, "O(n)", "O(64KB)");
    c.parameters = {{"acceleration", "compression level"}};
    c.parameter_ranges = {range("acceleration", {1, 2, 4, 8})};
    out.push_back(std::move(c));

    c = make(Category::Dictionary, "Zstandard (ZSTD)",
             R"tex(FSE(\text{literals}) + FSE(\text{sequences}) + \text{match copying})tex",
             "ZSTD = FSE_entropy(literals) + FSE_entropy(sequences) + matches",
             "Modern LZ77 + ANS entropy coding; excellent ratio/speed tradeoff",
             {S1, S2, S3}, "O(n)", "O(window_size)");
    c.parameters = {{"level", "compression level"}};
    c.parameter_ranges = {range("level", int_range(1, 22))};
    out.push_back(std::move(c));
}

void add_entropy_coders(std::vector<Component>& out) {
    auto c = make(Category::EntropyCoder, "Huffman Coding",
                  R"tex(L(x) = \lceil -\log_2 p(x) \rceil \text{ (optimal prefix code)})tex",
                  "code_length(x) = ceil(-log2(p(x)))",
                  "Optimal prefix-free code for known distributions; used in DEFLATE",
                  {S3}, "O(n + |Σ| log |Σ|)", "O(|Σ|)");
    c.parameters = {{"adaptive", "whether to adapt code dynamically"}};
    c.parameter_ranges = {range("adaptive", {false, true})};
    out.push_back(std::move(c));

    c = make(Category::EntropyCoder, "Canonical Huffman",
             R"tex(\text{code}(s) = \text{base}[len(s)] + \text{rank within length})tex",
             "code(s) = base[length(s)] + rank_within_same_length",
             "Huffman variant requiring only code lengths to reconstruct; used in DEFLATE",
             {S3}, "O(n + |Σ| log |Σ|)", "O(|Σ|)");
    out.push_back(std::move(c));

    c = make(Category::EntropyCoder, "Arithmetic Coding",
             R"tex([low, high) \leftarrow [low + range \cdot CDF(x-1), low + range \cdot CDF(x)))tex",
             "[low, high) = [low + range*CDF(x-1), low + range*CDF(x))",
             "Near-optimal entropy coding; approaches H(X) bits per symbol",
             {S3}, "O(n)", "O(1)");
    c.parameters = {{"precision", "arithmetic precision bits"}};
    c.parameter_ranges = {range("precision", {16, 24, 32, 64})};
    out.push_back(std::move(c));

    c = make(Category::EntropyCoder, "Range Coding",
             R"tex(range = high - low; \quad high = low + range \cdot p_{cum}(x); \quad low += range \cdot p_{cum}(x-1))tex",
             "range = high - low; update [low, high) based on cumulative probability",
             "Arithmetic coding variant with byte-aligned output; used in LZMA",
             {S3}, "O(n)", "O(1)");
    out.push_back(std::move(c));

    c = make(Category::EntropyCoder, "Asymmetric Numeral Systems (ANS)",
             R"tex(C(x, s) = \lfloor x/f_s \rfloor \cdot 2^n + CDF(s) + (x \mod f_s))tex",
             "C(state, symbol) = floor(state/freq) * 2^n + CDF(symbol) + (state mod freq)",
             "Modern entropy coder combining arithmetic efficiency with table-based speed",
             {S3}, "O(n)", "O(2^table_log)");
    c.parameters = {{"table_log", "log2 of state table size"}};
    c.parameter_ranges = {range("table_log", {9, 10, 11, 12})};
    out.push_back(std::move(c));

    c = make(Category::EntropyCoder, "tANS (Tabled ANS)",
             R"tex(state' = table[state][symbol]; \quad \text{output} = state' \gg \text{bits})tex",
             "new_state = encoding_table[state][symbol]; output overflowing bits",
             "Table-driven ANS for very fast encoding/decoding; used in ZSTD",
             {S3}, "O(n)", "O(|Σ| * 2^table_log)");
    c.parameters = {{"table_log", "log2 of table size"}};
    c.parameter_ranges = {range("table_log", {9, 10, 11, 12})};
    out.push_back(std::move(c));

    c = make(Category::EntropyCoder, "rANS (Range ANS)",
             R"tex(x' = (x // f_s) \cdot M + CDF(s) + (x \mod f_s))tex",
             "new_state = (state // freq) * total_freq + CDF(symbol) + (state mod freq)",
             "Range-based ANS; good for adaptive coding",
             {S3}, "O(n)", "O(|Σ|)");
    c.parameters = {{"precision", "frequency precision bits"}};
    c.parameter_ranges = {range("precision", {12, 14, 16})};
    out.push_back(std::move(c));
}

void add_run_length_coders(std::vector<Component>& out) {
    auto c = make(Category::RunLength, "Basic RLE",
                  R"tex(\text{encode}(s^n) = (n, s))tex",
                  "encode(symbol repeated n times) = (count, symbol)",
                  "Replace runs of identical symbols with (count, symbol) pairs",
                  {S2, S3}, "O(n)", "O(1)");
    c.parameters = {{"max_run", "maximum run length"}};
    c.parameter_ranges = {range("max_run", {127, 255, 65535})};
    out.push_back(std::move(c));

    c = make(Category::RunLength, "PackBits RLE",
             R"tex(\begin{cases} n \geq 0: & n+1 \text{ literal bytes follow} \\ n < 0: & \text{repeat next byte } |n|+1 \text{ times} \end{cases})tex",
             "n >= 0: (n+1) literals follow; n < 0: repeat next byte (|n|+1) times",
             "Apple's RLE variant; efficient for mixed runs and literals",
             {S2, S3}, "O(n)", "O(1)");
    out.push_back(std::move(c));

    c = make(Category::RunLength, "Zero RLE",
             R"tex(\text{encode}(0^n) = (\text{ZERO\_TOKEN}, n); \text{ others literal})tex",
             "encode(n zeros) = (ZERO_TOKEN, count); non-zeros passed through",
             "RLE specialized for runs of zeros; common after BWT+MTF",
             {S2}, "O(n)", "O(1)");
    c.parameters = {{"threshold", "minimum zeros to encode"}};
    c.parameter_ranges = {range("threshold", {1, 2, 3})};
    c.prerequisites = {"Move-to-Front Transform"};
    out.push_back(std::move(c));

    c = make(Category::RunLength, "Golomb-Rice RLE",
             R"tex(q = \lfloor n/m \rfloor, r = n \mod m; \text{ encode } q \text{ in unary, } r \text{ in binary})tex",
             "quotient = n // m; remainder = n mod m; output unary(q) + binary(r)",
             "Variable-length RLE using Golomb coding; optimal for geometric distribution",
             {S2, S3}, "O(n)", "O(1)");
    c.parameters = {{"m", "Golomb divisor (power of 2 for Rice)"}};
    c.parameter_ranges = {range("m", {1, 2, 4, 8, 16, 32})};
    out.push_back(std::move(c));
}

void add_context_models(std::vector<Component>& out) {
    auto c = make(Category::ContextModel, "Context Mixing (Linear)",
                  R"tex(P = \sum_{i} w_i \cdot P_i \text{ where } \sum w_i = 1)tex",
                  "P = SUM(weight_i * P_i) where weights sum to 1",
                  "Weighted combination of multiple context model predictions",
                  {S2}, "O(n * num_models)", "O(num_models * model_size)");
    c.parameters = {{"num_models", "number of models to mix"}};
    c.parameter_ranges = {range("num_models", {2, 4, 8, 16})};
    out.push_back(std::move(c));

    c = make(Category::ContextModel, "Context Mixing (Logistic/PAQ)",
             R"tex(P = \sigma\left(\sum_i w_i \cdot \text{stretch}(P_i)\right) \text{ where stretch}(p) = \ln\frac{p}{1-p})tex",
             "P = sigmoid(SUM(w_i * ln(P_i / (1 - P_i))))",
             "Logistic mixing in log-odds space; more stable than linear mixing",
             {S2}, "O(n * num_models)", "O(num_models * model_size)");
    c.parameters = {{"learning_rate", "weight adaptation rate"}};
    c.parameter_ranges = {range("learning_rate", {0.001, 0.005, 0.01, 0.05})};
    out.push_back(std::move(c));

    c = make(Category::ContextModel, "Secondary Symbol Estimation (SSE)",
             R"tex(P' = T[context][discretize(P)])tex",
             "P_adjusted = lookup_table[context][quantized_probability]",
             "Table-based probability adjustment; sharpens mixer output",
             {S2}, "O(1)", "O(contexts * 2^table_bits)");
    c.parameters = {{"table_bits", "bits for probability quantization"}};
    c.parameter_ranges = {range("table_bits", {5, 6, 7, 8})};
    out.push_back(std::move(c));

    c = make(Category::ContextModel, "Indirect Context Model",
             R"tex(context = hash(byte_{-1}, byte_{-2}, ..., bit\_pos))tex",
             "context = hash(previous_bytes, current_bit_position)",
             "Uses hash of recent bytes plus bit position as context",
             {S2}, "O(1)", "O(2^context_bits)");
    c.parameters = {{"context_bits", "bits for context hash"}};
    c.parameter_ranges = {range("context_bits", {16, 18, 20, 22, 24})};
    out.push_back(std::move(c));

    c = make(Category::ContextModel, "Match Model",
             R"tex(P(bit) = \begin{cases} 0.99 & \text{if match and bit matches} \\ 0.01 & \text{if match and bit differs} \\ 0.5 & \text{no match} \end{cases})tex",
             "P(bit) = 0.99 if matching_context AND bit_matches, else 0.01 if differs, else 0.5",
             "Predicts based on longest context match in history",
             {S2}, "O(n)", "O(history_size)");
    c.parameters = {{"min_match", "minimum match length"}};
    c.parameter_ranges = {range("min_match", {4, 8, 16})};
    out.push_back(std::move(c));
}

void add_filters(std::vector<Component>& out) {
    auto c = make(Category::Filter, "E8/E9 Transform (x86 filter)",
                  R"tex(\text{CALL/JMP}(rel) \rightarrow \text{CALL/JMP}(abs))tex",
                  "convert relative x86 CALL/JMP addresses to absolute",
                  "Converts relative x86 jump addresses to absolute for better compression",
                  {S0}, "O(n)", "O(1)");
    out.push_back(std::move(c));

    c = make(Category::Filter, "ARM Filter",
             R"tex(\text{BL}(rel) \rightarrow \text{BL}(abs))tex",
             "convert relative ARM branch-link addresses to absolute",
             "Converts relative ARM BL addresses to absolute",
             {S0}, "O(n)", "O(1)");
    out.push_back(std::move(c));

    c = make(Category::Filter, "Record Reordering",
             R"tex(interleave(col_1, col_2, ..., col_n) \text{ from } (rec_1, rec_2, ...))tex",
             "reorder [rec1, rec2, ...] to [col1_values, col2_values, ...]",
             "Reorders columnar data for better locality",
             {S0}, "O(n)", "O(n)");
    c.parameters = {{"record_size", "fixed record size in bytes"}};
    c.parameter_ranges = {range("record_size", {4, 8, 16, 32, 64, 128})};
    out.push_back(std::move(c));

    c = make(Category::Filter, "RGB → YCbCr (Lossless)",
             R"tex(Y = R + G + B; Cb = B - G; Cr = R - G)tex",
             "Y = R + G + B; Cb = B - G; Cr = R - G (reversible integer version)",
             "Reversible color space transform; decorrelates image data",
             {S0}, "O(n)", "O(1)");
    out.push_back(std::move(c));

    c = make(Category::Filter, "Bit Plane Separation",
             R"tex(planes[i] = (bytes >> i) \& 1 \text{ for } i \in [0, 7])tex",
             "split bytes into 8 bit planes: plane[i] = all i-th bits",
             "Separates data into bit planes for better entropy coding",
             {S0}, "O(n)", "O(n)");
    out.push_back(std::move(c));
}

void add_integer_coders(std::vector<Component>& out) {
    auto c = make(Category::IntegerCoder, "Unary Code",
                  R"tex(U(n) = 1^n 0 \text{ (n ones followed by zero)})tex",
                  "U(n) = n ones followed by a zero",
                  "Simplest universal code; optimal for geometric(0.5) distribution",
                  {S3}, "O(n) per integer", "O(1)");
    out.push_back(std::move(c));

    c = make(Category::IntegerCoder, "Elias Gamma Code",
             R"tex(\gamma(n) = U(\lfloor\log_2 n\rfloor) \cdot bin(n))tex",
             "gamma(n) = unary(floor(log2(n))) + binary(n)",
             "Universal code: unary length prefix + binary value",
             {S3}, "O(log n) per integer", "O(1)");
    out.push_back(std::move(c));

    c = make(Category::IntegerCoder, "Elias Delta Code",
             R"tex(\delta(n) = \gamma(\lfloor\log_2 n\rfloor + 1) \cdot bin(n \mod 2^{\lfloor\log_2 n\rfloor}))tex",
             "delta(n) = gamma(floor(log2(n)) + 1) + binary(n mod 2^floor(log2(n)))",
             "More efficient than gamma for larger integers",
             {S3}, "O(log log n) per integer", "O(1)");
    out.push_back(std::move(c));

    c = make(Category::IntegerCoder, "Golomb Code",
             R"tex(G_m(n) = U(\lfloor n/m \rfloor) \cdot bin_m(n \mod m))tex",
             "G_m(n) = unary(n // m) + binary(n mod m, ceil(log2(m)) bits)",
             "Optimal for geometric distribution with parameter p; m ≈ -1/log2(1-p)",
             {S3}, "O(n/m + log m) per integer", "O(1)");
    c.parameters = {{"m", "Golomb parameter"}};
    c.parameter_ranges = {range("m", {1, 2, 3, 4, 5, 6, 7, 8, 10, 16, 32})};
    out.push_back(std::move(c));

    c = make(Category::IntegerCoder, "Rice Code",
             R"tex(R_k(n) = U(n >> k) \cdot bin(n \& (2^k - 1), k))tex",
             "R_k(n) = unary(n >> k) + k lowest bits of n",
             "Golomb code with m = 2^k; simpler and faster",
             {S3}, "O(n >> k + k) per integer", "O(1)");
    c.parameters = {{"k", "Rice parameter (log2 of divisor)"}};
    c.parameter_ranges = {range("k", int_range(0, 6))};
    out.push_back(std::move(c));

    c = make(Category::IntegerCoder, "Exponential Golomb",
             R"tex(Exp(n, k) = \gamma(1 + (n >> k)) \cdot bin(n \& (2^k-1), k))tex",
             "ExpGolomb(n, k) = gamma(1 + (n >> k)) + k lowest bits",
             "Used in H.264/AVC video coding",
             {S3}, "O(log(n >> k) + k) per integer", "O(1)");
    c.parameters = {{"k", "order parameter"}};
    c.parameter_ranges = {range("k", {0, 1, 2, 3})};
    out.push_back(std::move(c));

    c = make(Category::IntegerCoder, "VByte / Varint",
             R"tex(\text{VByte}(n) = \text{7 bits data + 1 continuation bit per byte})tex",
             "VByte(n) = sequence of 7-bit chunks with high-bit continuation flag",
             "Simple variable-byte integer encoding; used in Protocol Buffers",
             {S3}, "O(log n / 7) per integer", "O(1)");
    out.push_back(std::move(c));
}

} // namespace

std::vector<Component> builtin_components() {
    std::vector<Component> components;
    add_entropy_measures(components);
    add_transforms(components);
    add_predictors(components);
    add_dictionary_methods(components);
    add_entropy_coders(components);
    add_run_length_coders(components);
    add_context_models(components);
    add_filters(components);
    add_integer_coders(components);
    return components;
}

} // namespace component_catalog
