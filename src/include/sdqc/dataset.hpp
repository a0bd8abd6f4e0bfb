/* ──────────────────────────────────────────────────────────────
   dataset.hpp  –  JSON thread files and annotation files

   threads.json   {"threads":[{"messages":[{"id":…,"text":…,"parent":…|null, …}]}]}
                  or a bare array of such thread objects
   labels.json    {"<id>": "support" | "deny" | "query" | "comment", …}
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <string>
#include <vector>

#include "sdqc/common.hpp"
#include "sdqc/labels.hpp"
#include "sdqc/thread_store.hpp"

namespace sdqc {

/* adds every message to `store`, returns them in file order */
std::vector<const Message*> load_threads(const std::string& path, ThreadStore& store);
std::vector<const Message*> parse_threads(const json& doc, ThreadStore& store);

Annotations load_annotations(const std::string& path);
Annotations parse_annotations(const json& doc);

/* throws when any message has no annotation */
void require_annotations(const std::vector<const Message*>& messages,
                         const Annotations&                 ann,
                         const std::string&                 what);

} // namespace sdqc
