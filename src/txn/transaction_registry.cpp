#include "txn/transaction_registry.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "utils/errors.hpp"

namespace kanbanhub::txn
{

void TransactionRegistry::insert(std::shared_ptr<TransactionContext> context)
{
    const std::string id = context->id();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_contexts.emplace(id, std::move(context)).second)
        throw ValidationError(fmt::format("Transaction id {} is already registered", id));
}

bool TransactionRegistry::erase(const std::string &id) noexcept
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_contexts.erase(id) > 0;
}

std::size_t TransactionRegistry::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_contexts.size();
}

bool TransactionRegistry::contains(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_contexts.find(id) != m_contexts.end();
}

std::optional<TransactionInfo> TransactionRegistry::find(const std::string &id) const
{
    std::shared_ptr<TransactionContext> context;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_contexts.find(id);
        if (it == m_contexts.end())
            return std::nullopt;
        context = it->second;
    }
    return context->snapshot();
}

std::vector<TransactionInfo> TransactionRegistry::snapshot() const
{
    std::vector<std::shared_ptr<TransactionContext>> contexts;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        contexts.reserve(m_contexts.size());
        for (const auto &[id, context] : m_contexts)
            contexts.push_back(context);
    }
    std::vector<TransactionInfo> infos;
    infos.reserve(contexts.size());
    for (const auto &context : contexts)
        infos.push_back(context->snapshot());
    std::sort(infos.begin(), infos.end(),
              [](const TransactionInfo &a, const TransactionInfo &b) { return a.start_time < b.start_time; });
    return infos;
}

std::size_t TransactionRegistry::total_operations() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t total = 0;
    for (const auto &[id, context] : m_contexts)
        total += context->operation_count();
    return total;
}

} // namespace kanbanhub::txn
