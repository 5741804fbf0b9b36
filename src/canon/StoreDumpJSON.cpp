#include "canon/StoreDumpJSON.hpp"

#include "canon/IdentStore.hpp"

#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "spdlog/spdlog.h"

namespace canon {

class StoreDumpJSON::Impl {
public:
    Impl() = default;
    ~Impl() = default;

    bool dump(const IdentStore& store, bool prettyPrint) {
        m_doc.SetObject();
        m_buffer.Clear();
        auto& alloc = m_doc.GetAllocator();

        rapidjson::Value occurrences;
        occurrences.SetArray();
        occurrences.Reserve(static_cast<rapidjson::SizeType>(store.size()), alloc);
        for (uint32_t i = 0; i < store.size(); ++i) {
            rapidjson::Value occurrence;
            encodeOccurrence(store, store.occurrence(i), occurrence);
            occurrences.PushBack(occurrence, alloc);
        }
        m_doc.AddMember("occurrences", occurrences, alloc);
        m_doc.AddMember("distinctTexts", static_cast<uint64_t>(store.interner().size()), alloc);

        bool result = false;
        if (prettyPrint) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(m_buffer);
            result = m_doc.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(m_buffer);
            result = m_doc.Accept(writer);
        }
        if (!result) {
            SPDLOG_ERROR("Failed to encode identifier store of {} occurrences as JSON", store.size());
        }
        return result;
    }

    std::string_view json() const { return std::string_view(m_buffer.GetString(), m_buffer.GetSize()); }

private:
    rapidjson::Document m_doc;
    rapidjson::StringBuffer m_buffer;

    void encodeOccurrence(const IdentStore& store, IdentIdx idx, rapidjson::Value& value) {
        auto& alloc = m_doc.GetAllocator();
        value.SetObject();
        value.AddMember("index", idx.index(), alloc);

        // Interned text outlives the document, so no copy is needed.
        auto text = store.textOf(idx);
        value.AddMember("text", rapidjson::StringRef(text.data(), static_cast<rapidjson::SizeType>(text.size())),
                        alloc);

        value.AddMember("effectful", idx.isEffectful(), alloc);
        value.AddMember("ignored", idx.isIgnored(), alloc);
        value.AddMember("reassignable", idx.isReassignable(), alloc);

        auto region = store.regionOf(idx);
        rapidjson::Value regionValue;
        regionValue.SetObject();
        regionValue.AddMember("start", region.start, alloc);
        regionValue.AddMember("end", region.end, alloc);
        value.AddMember("region", regionValue, alloc);

        value.AddMember("exposingModule", static_cast<uint32_t>(store.exposingModuleOf(idx)), alloc);
    }
};

StoreDumpJSON::StoreDumpJSON(): m_impl(std::make_unique<StoreDumpJSON::Impl>()) {}

StoreDumpJSON::~StoreDumpJSON() {}

bool StoreDumpJSON::dump(const IdentStore& store, bool prettyPrint) { return m_impl->dump(store, prettyPrint); }

std::string_view StoreDumpJSON::json() const { return m_impl->json(); }

} // namespace canon
