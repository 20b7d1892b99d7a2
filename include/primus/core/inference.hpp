/*
 * Primus C++ - Inference Boundary
 *
 * The model backend is an external collaborator. It receives a prompt and a
 * context bundle holding only partitions the actor was allowed to read.
 */
#ifndef primus_CORE_INFERENCE_HPP
#define primus_CORE_INFERENCE_HPP

#include <primus/core/types.hpp>
#include <primus/core/json.hpp>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace primus {

struct ContextSnippet {
    PartitionId partition;
    std::string text;
};

struct ContextBundle {
    std::vector<ContextSnippet> snippets;
    std::vector<PartitionId> withheld;    // requested but denied or failed

    bool empty() const { return snippets.empty(); }

    // Snippets joined as "[owner/class]\ntext" blocks
    std::string render() const;
};

class InferenceBackend {
public:
    virtual ~InferenceBackend() {}

    virtual std::string backend_id() const = 0;

    // Local backends never leave the machine
    virtual bool is_local() const = 0;

    virtual bool complete(const std::string& prompt, const ContextBundle& context, std::string& out) = 0;
};

// Pattern redaction applied to bundles sent to non-local backends
class Redactor {
public:
    Redactor();

    // Card numbers, SSNs and "password: ..." fragments
    void add_default_rules();

    bool add_rule(const std::string& pattern, const std::string& replacement);

    // Array of [pattern, replacement] pairs; invalid entries are skipped
    size_t load(const Json& rules);

    std::string apply(const std::string& text) const;
    void apply(ContextBundle& bundle) const;

    size_t rule_count() const { return rules_.size(); }

private:
    std::vector<std::pair<std::regex, std::string> > rules_;
};

} // namespace primus

#endif // primus_CORE_INFERENCE_HPP
