#include "sandbox/sandbox.hpp"

#include "glog/logging.h"

namespace sandbox {

Sandbox::store_t* Sandbox::Boxes_() {
  static store_t* boxes = new store_t;
  return boxes;
}

void Sandbox::Register_(const std::string& name, Sandbox::create_t create,
                        Sandbox::score_t score) {
  Boxes_()->push_back(Entry{name, std::move(create), std::move(score)});
}

std::unique_ptr<Sandbox> Sandbox::Create() {
  static int best_sandbox = [] {
    const store_t& boxes = *Boxes_();
    int best = -1;
    int best_score = 0;
    for (size_t i = 0; i < boxes.size(); i++) {
      int score = boxes[i].score();
      VLOG(1) << "Sandbox " << boxes[i].name << " has score " << score;
      if (score > best_score) {
        best_score = score;
        best = static_cast<int>(i);
      }
    }
    if (best != -1) LOG(INFO) << "Using sandbox " << boxes[best].name;
    return best;
  }();
  if (best_sandbox == -1) {
    LOG(ERROR) << "No sandbox could be found";
    return nullptr;
  }
  return std::unique_ptr<Sandbox>((*Boxes_())[best_sandbox].create());
}

std::unique_ptr<Sandbox> Sandbox::Create(const std::string& name) {
  for (const Entry& entry : *Boxes_()) {
    if (entry.name != name) continue;
    if (entry.score() <= 0) return nullptr;
    return std::unique_ptr<Sandbox>(entry.create());
  }
  return nullptr;
}

}  // namespace sandbox
