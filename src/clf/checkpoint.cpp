#include "clf/checkpoint.hpp"
#include <filesystem>
#include <stdexcept>

namespace clf {

void save_checkpoint(const std::string& path, const CheckpointRecord& record,
                     torch::nn::Module& model, torch::optim::Optimizer& optimizer) {
  torch::serialize::OutputArchive archive;
  archive.write("epoch", c10::IValue(record.epoch));
  archive.write("val_acc", c10::IValue(record.val_accuracy));

  torch::serialize::OutputArchive model_archive;
  model.save(model_archive);
  archive.write("model", model_archive);

  torch::serialize::OutputArchive optimizer_archive;
  optimizer.save(optimizer_archive);
  archive.write("optimizer", optimizer_archive);

  const std::string tmp = path + ".tmp";
  try {
    archive.save_to(tmp);
  } catch (const c10::Error& e) {
    throw std::runtime_error("Cannot write checkpoint '" + tmp + "': " + e.what_without_backtrace());
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) throw std::runtime_error("Cannot move checkpoint into place '" + path + "': " + ec.message());
}

CheckpointRecord load_checkpoint(const std::string& path, torch::nn::Module& model, torch::Device device,
                                 torch::optim::Optimizer* optimizer) {
  torch::serialize::InputArchive archive;
  try {
    archive.load_from(path, device);
  } catch (const c10::Error& e) {
    throw std::runtime_error("Cannot read checkpoint '" + path + "': " + e.what_without_backtrace());
  }

  CheckpointRecord record;
  c10::IValue epoch, val_acc;
  if (!archive.try_read("epoch", epoch) || !archive.try_read("val_acc", val_acc))
    throw std::runtime_error("Checkpoint '" + path + "' has no epoch/val_acc record");
  record.epoch = epoch.toInt();
  record.val_accuracy = val_acc.toDouble();

  torch::serialize::InputArchive model_archive;
  if (!archive.try_read("model", model_archive))
    throw std::runtime_error("Checkpoint '" + path + "' has no model state");
  model.load(model_archive);

  if (optimizer) {
    torch::serialize::InputArchive optimizer_archive;
    if (!archive.try_read("optimizer", optimizer_archive))
      throw std::runtime_error("Checkpoint '" + path + "' has no optimizer state");
    optimizer->load(optimizer_archive);
  }
  return record;
}

bool CheckpointSelector::consider(int64_t epoch, double val_acc,
                                  const EpochMetrics& train, const EpochMetrics& val) {
  if (!(val_acc > best_score_)) return false;

  CheckpointRecord record{epoch, val_acc};
  persist_(record);

  best_score_ = val_acc;
  best_ = record;
  best_train_ = train;
  best_val_ = val;
  return true;
}

} // namespace clf
