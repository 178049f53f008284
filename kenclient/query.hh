#ifndef KENCLIENT_QUERY_H
#define KENCLIENT_QUERY_H

#include "kenclient/client.hh"

#include <boost/unordered_map.hpp>

#include <istream>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include <math.h>
#include <stdint.h>

namespace kenclient {

/* Hands out ids to words as they are first seen and registers them with the
 * client.  Id 0 is left unused.
 */
class QueryVocab {
  public:
    explicit QueryVocab(Client &client) : client_(client), next_(1) {}

    int Index(const std::string &word) {
      boost::unordered_map<std::string, int>::const_iterator found = ids_.find(word);
      if (found != ids_.end()) return found->second;
      int id = next_++;
      client_.RegisterWord(word, id);
      ids_[word] = id;
      return id;
    }

  private:
    Client &client_;
    boost::unordered_map<std::string, int> ids_;
    int next_;
};

struct BasicPrint {
  explicit BasicPrint(std::ostream &out) : out_(out) {}

  void Word(const std::string &, int, float) const {}
  void Line(uint64_t oov, float total) const {
    out_ << "Total: " << total << " OOV: " << oov << '\n';
  }
  void Summary(double, double, uint64_t, uint64_t) const {}

  std::ostream &out_;
};

struct FullPrint : public BasicPrint {
  explicit FullPrint(std::ostream &out) : BasicPrint(out) {}

  void Word(const std::string &surface, int id, float prob) const {
    out_ << surface << '=' << id << ' ' << prob << '\t';
  }

  void Summary(double ppl_including_oov, double ppl_excluding_oov, uint64_t corpus_oov, uint64_t corpus_tokens) const {
    out_ <<
      "Perplexity including OOVs:\t" << ppl_including_oov << "\n"
      "Perplexity excluding OOVs:\t" << ppl_excluding_oov << "\n"
      "OOVs:\t" << corpus_oov << "\n"
      "Tokens:\t" << corpus_tokens << '\n';
  }
};

/* Score each line of in as a whitespace-separated sentence.  With
 * sentence_context the line is wrapped in <s> and </s>; <s> only serves as
 * context.
 */
template <class Printer> void Query(Client &client, std::istream &in, const Printer &printer, bool sentence_context) {
  QueryVocab vocab(client);
  const int begin_sentence = vocab.Index("<s>");
  const int end_sentence = vocab.Index("</s>");

  double corpus_total = 0.0;
  double corpus_total_oov_only = 0.0;
  uint64_t corpus_oov = 0;
  uint64_t corpus_tokens = 0;

  std::string line, word;
  std::vector<int> ids;
  std::vector<std::string> surfaces;
  while (std::getline(in, line)) {
    ids.clear();
    surfaces.clear();
    if (sentence_context) ids.push_back(begin_sentence);
    const std::size_t start = ids.size();
    std::istringstream words(line);
    while (words >> word) {
      ids.push_back(vocab.Index(word));
      surfaces.push_back(word);
    }
    if (sentence_context) {
      ids.push_back(end_sentence);
      surfaces.push_back("</s>");
    }
    if (ids.size() == start) {
      printer.Line(0, 0.0);
      continue;
    }

    uint64_t oov = 0;
    std::vector<int> prefix(ids.begin(), ids.begin() + start);
    for (std::size_t i = start; i < ids.size(); ++i) {
      prefix.push_back(ids[i]);
      float prob = client.Probability(prefix);
      if (client.IsOutOfVocabulary(ids[i])) {
        ++oov;
        corpus_total_oov_only += prob;
      }
      printer.Word(surfaces[i - start], ids[i], prob);
    }
    float total = client.ProbabilityOfSuffix(ids, static_cast<int>(start));
    printer.Line(oov, total);
    corpus_total += total;
    corpus_oov += oov;
    corpus_tokens += ids.size() - start;
  }
  if (!corpus_tokens) return;
  printer.Summary(
      pow(10.0, -(corpus_total / static_cast<double>(corpus_tokens))),
      corpus_tokens == corpus_oov ? 0.0 : pow(10.0, -((corpus_total - corpus_total_oov_only) / static_cast<double>(corpus_tokens - corpus_oov))),
      corpus_oov,
      corpus_tokens);
}

} // namespace kenclient

#endif // KENCLIENT_QUERY_H
