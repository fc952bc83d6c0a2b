#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace MAESTRO
{
    /**
     * @brief A table of mutexes keyed by string (one per plugin identity). Updates to different keys never contend on the same
     * mutex; the table lock is only held while a key's mutex is looked up or created.
     *
     * @note Mutexes are never removed, so references returned by Get stay valid for the lifetime of the table.
     */
    class KeyedMutex final
    {
    public:
        std::mutex& Get(const std::string& Key)
        {
            std::lock_guard<std::mutex> Lock(m_TableMutex);

            auto& Slot = m_Mutexes[Key];
            if (!Slot)
            {
                Slot = std::make_unique<std::mutex>();
            }
            return *Slot;
        }

    private:
        std::mutex                                                   m_TableMutex;
        std::unordered_map<std::string, std::unique_ptr<std::mutex>> m_Mutexes;
    };
} // namespace MAESTRO
