#pragma once
#include "emb/Encoder.hpp"
#include "index/HnswIndex.hpp"
#include "io/ConfigIO.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace labelsearch::cli {

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// Numeric flags; a value that does not parse throws std::runtime_error.
size_t get_arg_size(int argc, char** argv, const std::string& key, size_t def);
int64_t get_arg_int(int argc, char** argv, const std::string& key, int64_t def);
double get_arg_double(int argc, char** argv, const std::string& key, double def);

// Required string flag; throws std::runtime_error naming it when absent.
std::string require_arg(int argc, char** argv, const std::string& key);

// --config <json> if given, then command-line overrides on top.
AppConfig load_app_config(int argc, char** argv);

// --encoder hashing (--weights <bin>, optional) | onnx (--model, --vocab, --max_len)
std::unique_ptr<Encoder> open_encoder(int argc, char** argv, const AppConfig& cfg);

// Loads a CorpusStore, builds the HNSW graph and installs it as the process
// index. Throws when the file is unreadable or holds no entries.
std::shared_ptr<const HnswIndex> install_corpus_index(const std::string& corpus_emb, const HnswConfig& cfg);

// Embeds the label file and rebuilds the process index with the new entries.
void add_label_entries(const std::string& label_file, const Encoder& encoder, const HnswConfig& cfg);

void check_encoder_dim(const Encoder& encoder, size_t index_dim);

Matrix encode_in_batches(const Encoder& encoder, const std::vector<std::string>& texts, size_t batch);

}  // namespace labelsearch::cli
