/* -----------------------------------------------------------
 *  dataset.cpp – thread / annotation loaders
 * ----------------------------------------------------------- */
#include <stdexcept>

#include "sdqc/dataset.hpp"

namespace sdqc {

namespace {

/* twitter ids show up both as strings and as numbers */
std::string id_of(const json& v, const char* field)
{
    if (v.is_string())          return v.get<std::string>();
    if (v.is_number_unsigned()) return std::to_string(v.get<unsigned long long>());
    if (v.is_number_integer())  return std::to_string(v.get<long long>());
    throw std::runtime_error(std::string("message field '") + field + "' must be a string or integer, got " +
                             v.dump());
}

Message message_from_json(const json& j)
{
    if (!j.is_object()) throw std::runtime_error("message entry is not an object: " + j.dump());

    Message m;
    m.id   = id_of(j.at("id"), "id");
    m.text = j.value("text", std::string());
    if (j.contains("parent") && !j["parent"].is_null())
        m.parent_id = id_of(j["parent"], "parent");

    m.fields = json::object();
    for (auto it = j.begin(); it != j.end(); ++it)
        if (it.key() != "id" && it.key() != "text" && it.key() != "parent")
            m.fields[it.key()] = it.value();
    return m;
}

} // namespace

std::vector<const Message*> parse_threads(const json& doc, ThreadStore& store)
{
    try {
        const json& threads = doc.is_array() ? doc : doc.at("threads");
        if (!threads.is_array()) throw std::runtime_error("'threads' must be an array");

        std::vector<const Message*> out;
        for (const auto& t : threads)
            for (const auto& mj : t.at("messages"))
                out.push_back(&store.add(message_from_json(mj)));
        return out;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("malformed thread file: ") + e.what());
    }
}

std::vector<const Message*> load_threads(const std::string& path, ThreadStore& store)
{
    auto msgs = parse_threads(read_json_file(path), store);
    logI("loaded " + std::to_string(msgs.size()) + " messages from " + path);
    return msgs;
}

Annotations parse_annotations(const json& doc)
{
    if (!doc.is_object()) throw std::runtime_error("annotation file must be a JSON object");

    Annotations ann;
    ann.reserve(doc.size());
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (!it.value().is_string())
            throw std::runtime_error("label of " + it.key() + " is not a string");
        try {
            ann.emplace(it.key(), parse_stance(it.value().get<std::string>()));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("message " + it.key() + ": " + e.what());
        }
    }
    return ann;
}

Annotations load_annotations(const std::string& path)
{
    Annotations ann = parse_annotations(read_json_file(path));
    logI("loaded " + std::to_string(ann.size()) + " annotations from " + path);
    return ann;
}

void require_annotations(const std::vector<const Message*>& messages,
                         const Annotations&                 ann,
                         const std::string&                 what)
{
    size_t missing = 0;
    std::string first;
    for (const Message* m : messages)
        if (!ann.count(m->id) && missing++ == 0) first = m->id;
    if (missing)
        throw std::runtime_error(std::to_string(missing) + " " + what +
                                 " message(s) lack an annotation, first: " + first);
}

} // namespace sdqc
