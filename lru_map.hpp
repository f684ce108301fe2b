#pragma once

#include <functional>
#include <list>
#include <unordered_map>
#include <optional>

// Bounded map evicting the least recently inserted key. Lookups do not
// refresh a key, so a const lookup is safe under a shared lock.
template<typename key_t, typename value_t, typename hash_t = std::hash<key_t>>
class lru_map {
public:
    lru_map(const size_t p_max_size): m_max_size(p_max_size) {};

    // returns true when an older key had to be evicted to make room
    bool
    insert(const key_t &p_key, const value_t &p_value)
    {
        const auto l_iterator = m_map.find(p_key);

        if (l_iterator != m_map.end()) {
            l_iterator->second->second = p_value;

            m_list.splice(m_list.begin(), m_list, l_iterator->second);
        } else {
            m_list.push_front(std::pair<key_t, value_t>{p_key, p_value});
            m_map[p_key] = m_list.begin();
        }

        if (m_map.size() > m_max_size) {
            m_map.erase(m_list.back().first);
            m_list.pop_back();

            return true;
        }

        return false;
    }

    std::optional<value_t>
    lookup(const key_t &p_key) const
    {
        const auto l_iterator = m_map.find(p_key);

        if (l_iterator != m_map.end()) {
            return std::optional<value_t>(l_iterator->second->second);
        } else {
            return std::nullopt;
        }
    }

    bool
    erase(const key_t &p_key)
    {
        const auto l_iterator = m_map.find(p_key);

        if (l_iterator == m_map.end()) {
            return false;
        }

        m_list.erase(l_iterator->second);
        m_map.erase(l_iterator);

        return true;
    }

    template<typename predicate_t>
    size_t
    erase_if(predicate_t p_predicate)
    {
        size_t l_removed = 0;

        for (auto l_iter = m_list.begin(); l_iter != m_list.end();) {
            if (p_predicate(l_iter->first, l_iter->second)) {
                m_map.erase(l_iter->first);
                l_iter = m_list.erase(l_iter);
                l_removed++;
            } else {
                ++l_iter;
            }
        }

        return l_removed;
    }

    size_t size() const { return m_map.size(); }

private:
    const size_t m_max_size;

    std::list<std::pair<key_t, value_t>> m_list;

    std::unordered_map<
        key_t,
        typename std::list<std::pair<key_t, value_t>>::iterator,
        hash_t
    > m_map;
};
