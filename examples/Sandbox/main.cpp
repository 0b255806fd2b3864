// main.cpp
#include <iostream>
#include <string>
#include <string_view>

#include <Tandem/Containers/AdaptiveMap.hpp>
#include <Tandem/Hashing/FNV.hpp>

using namespace Tandem::Containers;
using namespace Tandem::Hashing;

using WordCounts = AdaptiveMap<std::string, int, FnvHasher, TransparentEqual>;

// Prints which backend the map is using
void Report(const char* label, const WordCounts& counts)
{
    std::cout << "[" << label << "] size=" << counts.Size() << " capacity=" << counts.Capacity()
              << " backend=" << (counts.IsVec() ? "linear" : "hashed") << "\n";
}

// Counts words through the entry API
void CountWords(WordCounts& counts, int distinct)
{
    for (int i = 0; i < distinct; ++i)
    {
        const std::string word = "word" + std::to_string(i);
        counts.Entry(word).AndModify([](int& n) { ++n; }).OrInsert(1);
    }
}

int main()
{
    WordCounts counts;
    Report("fresh", counts);

    CountWords(counts, WordCounts::kLinearLimit);
    CountWords(counts, 4);
    Report("at the linear limit", counts);

    // Entry insertion never migrates; a plain insert does.
    counts.Insert("overflow", 1);
    Report("after Insert", counts);

    std::cout << "word0 seen " << counts.Get("word0") << " times\n";
    std::cout << "word9 seen " << counts.Get("word9") << " times\n";

    const auto hash = counts.HashKey(std::string_view("word3"));
    if (auto kv = counts.RawEntry().FromKeyHashed(hash, std::string_view("word3")))
        std::cout << "raw lookup: " << kv->key << " -> " << kv->value << "\n";

    counts.Retain([](const std::string&, int& n) { return n > 1; });
    Report("after Retain", counts);

    int drained = 0;
    for (auto& pair: counts.Drain())
        drained += pair.second;
    std::cout << "drained total=" << drained << "\n";
    Report("after Drain", counts);

    return 0;
}
