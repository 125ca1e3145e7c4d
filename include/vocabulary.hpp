#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

/**
 * @brief Bidirectional mapping between pieces (or words) and integer ids.
 *
 * A default-constructed vocabulary holds the special tokens [PAD] and [UNK].
 * Lookups of unknown entries return the [UNK] id.
 */
class Vocabulary {
  private:
    std::unordered_map<std::string, int> token_to_id;  ///< Maps tokens to their unique IDs
    std::vector<std::string> id_to_token;              ///< Maps IDs back to their tokens
    int unk_token_id;                                  ///< ID for unknown token
    int pad_token_id;                                  ///< ID for padding token

    void rebuild_index();

  public:
    /**
     * @brief Creates a vocabulary containing only the special tokens.
     */
    Vocabulary();

    /**
     * @brief Loads a one-token-per-line vocabulary file (BERT vocab.txt layout).
     *
     * Line numbers become ids. The file must contain [UNK]; [PAD] is optional.
     *
     * @throws std::runtime_error if the file cannot be read, contains duplicate
     *         entries or has no [UNK] entry
     */
    static Vocabulary load_from_file(const std::string& path);

    /**
     * @brief Builds a word-piece vocabulary from training word forms.
     *
     * Contains every word seen at least `min_frequency` times, plus every
     * character both as a word-initial piece and as a "##" continuation piece,
     * so that every word made of seen characters can be segmented.
     */
    static Vocabulary build_from_words(const std::vector<std::string>& words,
                                       size_t min_frequency);

    /**
     * @brief Builds a whole-word vocabulary (no character pieces).
     */
    static Vocabulary build_word_vocabulary(const std::vector<std::string>& words,
                                            size_t min_frequency);

    /**
     * @brief Writes one token per line, in id order.
     * @throws std::runtime_error if the file cannot be written
     */
    void save_to_file(const std::string& path) const;

    /**
     * @brief Adds a token if missing.
     * @return The token id
     */
    int add_token(const std::string& token);

    /**
     * @brief Gets the ID for a given token.
     * @return ID of the token, or the UNK ID if not found
     */
    int get_id(const std::string& token) const;

    /**
     * @brief Gets the token for a given ID.
     * @throws std::out_of_range for an invalid id
     */
    const std::string& get_token(int id) const;

    size_t size() const {
        return id_to_token.size();
    }

    int get_unk_token_id() const {
        return unk_token_id;
    }

    int get_pad_token_id() const {
        return pad_token_id;
    }

    bool has_token(const std::string& token) const {
        return token_to_id.find(token) != token_to_id.end();
    }

    template <class Archive>
    void save(Archive& ar) const {
        ar(id_to_token);
    }

    template <class Archive>
    void load(Archive& ar) {
        ar(id_to_token);
        rebuild_index();
    }
};
