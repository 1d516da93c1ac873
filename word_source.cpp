/*
 * FILE: word_source.cpp
 *
 * WHAT:
 * Implements the data ingestion pipeline: read (or download) the raw word
 * list, normalise every line, and produce the sorted session dictionary.
 *
 * CRITICAL DEPENDENCIES:
 * - libcurl: a word list can live on the web (e.g. a raw GitHub file).
 *   The download is a plain blocking GET that follows redirects.
 *
 * WHY:
 * A robust loader is essential for stability. This file handles the dirty
 * work of file I/O, string trimming and de-duplication so the rest of the
 * application can assume clean, valid data.
 */

#include "word_source.h"
#include <curl/curl.h>
#include <stdio.h>
#include <string.h>
#include <ctype.h>
#include <stdlib.h>

/*
 * STRUCT: text_buffer_t
 *
 * A growable byte buffer, always kept null terminated.
 */
typedef struct _text_buffer
{
    char* data;
    size_t size;
} text_buffer_t;

/*
 * FUNCTION: write_callback
 *
 * WHAT:
 * A standard cURL callback handling received data chunks. It grows the
 * buffer with `realloc` so the whole response ends up in one string.
 *
 * RETURNS:
 * - The number of bytes consumed. Returning anything else makes cURL abort
 *   the transfer, which is how an allocation failure is signalled.
 */
static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t realsize = size * nmemb;
    text_buffer_t* p_buffer = (text_buffer_t*)userp;

    char* ptr = (char*)realloc(p_buffer->data, p_buffer->size + realsize + 1);
    if (ptr == NULL) return 0;

    p_buffer->data = ptr;
    memcpy(p_buffer->data + p_buffer->size, contents, realsize);
    p_buffer->size += realsize;
    p_buffer->data[p_buffer->size] = '\0';
    return realsize;
}

/*
 * FUNCTION: download_text
 *
 * WHAT:
 * Fetches `url` into a malloc'd, null-terminated string.
 * HTTP errors (4xx/5xx) count as failures.
 */
static char* download_text(const char* url)
{
    CURL* curl;
    CURLcode res = CURLE_FAILED_INIT;
    text_buffer_t buffer = { NULL, 0 };

    curl_global_init(CURL_GLOBAL_DEFAULT);
    curl = curl_easy_init();

    if (curl)
    {
        curl_easy_setopt(curl, CURLOPT_URL, url);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, (void*)&buffer);

        // Follow 301/302 redirects (raw file hosts move things around)
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, "wordle-advisor");

        res = curl_easy_perform(curl);
        if (res != CURLE_OK)
        {
            fprintf(stderr, "cURL failed for %s: %s\n", url, curl_easy_strerror(res));
        }
        curl_easy_cleanup(curl);
    }
    curl_global_cleanup();

    if (res != CURLE_OK)
    {
        free(buffer.data);
        return NULL;
    }

    // An empty response still yields a valid (empty) string
    if (buffer.data == NULL)
    {
        buffer.data = (char*)calloc(1, 1);
        if (buffer.data == NULL) fprintf(stderr, "Out of memory downloading %s\n", url);
    }
    return buffer.data;
}

/*
 * FUNCTION: read_text_file
 *
 * Reads a whole file into a malloc'd, null-terminated string.
 */
static char* read_text_file(const char* path)
{
    FILE* fpIn = fopen(path, "rb");
    if (fpIn == NULL)
    {
        fprintf(stderr, "Could not open word list '%s'!\n", path);
        return NULL;
    }

    text_buffer_t buffer = { NULL, 0 };
    char chunk[8192];
    size_t got;
    while ((got = fread(chunk, 1, sizeof(chunk), fpIn)) > 0)
    {
        if (write_callback(chunk, 1, got, &buffer) != got)
        {
            fprintf(stderr, "Out of memory reading '%s'!\n", path);
            free(buffer.data);
            fclose(fpIn);
            return NULL;
        }
    }

    if (ferror(fpIn))
    {
        fprintf(stderr, "Error reading word list '%s'!\n", path);
        free(buffer.data);
        fclose(fpIn);
        return NULL;
    }
    fclose(fpIn);

    if (buffer.data == NULL)
    {
        buffer.data = (char*)calloc(1, 1);
        if (buffer.data == NULL) fprintf(stderr, "Out of memory reading '%s'!\n", path);
    }
    return buffer.data;
}

static bool is_url(const char* source)
{
    return strncmp(source, "http://", 7) == 0 || strncmp(source, "https://", 8) == 0;
}

static int compare_words(const void* p1, const void* p2)
{
    return strcmp(((const word_t*)p1)->letters, ((const word_t*)p2)->letters);
}

bool parse_word_list_text(const char* text, int word_length, word_t** pp_words, int* p_word_count)
{
    *pp_words = NULL;
    *p_word_count = 0;
    if (word_length <= 0 || word_length > MAX_WORD_LENGTH) return false;

    int capacity = 1024;
    int count = 0;
    word_t* p_words = (word_t*)malloc(sizeof(word_t) * capacity);
    if (p_words == NULL)
    {
        fprintf(stderr, "Out of memory allocating the dictionary!\n");
        return false;
    }

    const char* p_line = text;
    while (*p_line != '\0')
    {
        // 1. Find the line bounds
        const char* p_end = p_line;
        while (*p_end != '\0' && *p_end != '\n') p_end++;

        // 2. Trim surrounding whitespace (including the '\r' of CRLF files)
        const char* p_first = p_line;
        const char* p_last = p_end;
        while (p_first < p_last && isspace((unsigned char)*p_first)) p_first++;
        while (p_last > p_first && isspace((unsigned char)*(p_last - 1))) p_last--;

        // 3. Keep only pure-letter words of the session length
        if (p_last - p_first == word_length)
        {
            word_t candidate;
            bool valid = true;
            for (int i = 0; i < word_length; i++)
            {
                unsigned char ch = (unsigned char)p_first[i];
                if (!isalpha(ch) || ch > 127) { valid = false; break; }
                candidate.letters[i] = (char)tolower(ch);
            }
            candidate.letters[word_length] = '\0';

            if (valid)
            {
                if (count == capacity)
                {
                    word_t* ptr = (word_t*)realloc(p_words, sizeof(word_t) * capacity * 2);
                    if (ptr == NULL)
                    {
                        fprintf(stderr, "Out of memory growing the dictionary!\n");
                        free(p_words);
                        return false;
                    }
                    p_words = ptr;
                    capacity *= 2;
                }
                p_words[count++] = candidate;
            }
        }

        p_line = (*p_end == '\n') ? p_end + 1 : p_end;
    }

    // 4. Sort, then squeeze out duplicates ("Apple" and "apple" collapse here)
    if (count > 0)
    {
        qsort(p_words, count, sizeof(word_t), compare_words);
        int unique_count = 1;
        for (int i = 1; i < count; i++)
        {
            if (strcmp(p_words[i].letters, p_words[unique_count - 1].letters) != 0)
            {
                p_words[unique_count++] = p_words[i];
            }
        }
        count = unique_count;
    }

    *pp_words = p_words;
    *p_word_count = count;
    return true;
}

bool load_dictionary(const char* source, int word_length, word_t** pp_dictionary, int* p_dictionary_count, bool verbose)
{
    *pp_dictionary = NULL;
    *p_dictionary_count = 0;

    if (source == NULL || *source == '\0')
    {
        fprintf(stderr, "No word list given.\n");
        return false;
    }
    if (word_length <= 0 || word_length > MAX_WORD_LENGTH)
    {
        fprintf(stderr, "Word length %d is not supported (1..%d).\n", word_length, MAX_WORD_LENGTH);
        return false;
    }

    // 1. Read or download
    if (verbose && is_url(source)) printf("Downloading word list from %s ...\n", source);
    char* p_text = is_url(source) ? download_text(source) : read_text_file(source);
    if (p_text == NULL) return false;

    // 2. Normalise
    word_t* p_words = NULL;
    int word_count = 0;
    bool parsed = parse_word_list_text(p_text, word_length, &p_words, &word_count);
    free(p_text);
    if (!parsed) return false;

    if (word_count == 0)
    {
        fprintf(stderr, "No %d-letter words found in '%s'.\n", word_length, source);
        free(p_words);
        return false;
    }

    if (verbose) printf("Loaded %d distinct %d-letter words from %s.\n", word_count, word_length, source);

    *pp_dictionary = p_words;
    *p_dictionary_count = word_count;
    return true;
}

const word_t* find_dictionary_word(const word_t* p_dictionary, int dictionary_count, const char* word)
{
    if (p_dictionary == NULL || dictionary_count <= 0 || strlen(word) > (size_t)MAX_WORD_LENGTH) return NULL;

    word_t key;
    memset(&key, 0, sizeof(key));
    strcpy(key.letters, word);
    return (const word_t*)bsearch(&key, p_dictionary, dictionary_count, sizeof(word_t), compare_words);
}

void free_dictionary(word_t* p_dictionary)
{
    free(p_dictionary);
}
