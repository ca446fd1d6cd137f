// see LICENSE.md for license.
#include <memory>
#include "zerocompressxx/api.hpp"

namespace zerocompress {
    static const fixed_width_scan_t selector_scan(selector_size, true);
    static const fixed_width_scan_t address_scan(address_size, false);
    static const greedy_scan_t pattern_scan;

    static inline const token_scan_t &
    scan_of(const stage_t stage)
    {
        switch (stage) {
        case stage_selector: return selector_scan;
        case stage_address: return address_scan;
        default: return pattern_scan;
        }
    }

    // NULL when the stage has no dictionary in this snapshot.
    static kernel_t *
    create_kernel(const stage_t stage, const dictionary_set_t::snapshot_t &snapshot,
                  const options_t &options)
    {
        if (stage == stage_zero_run)
            return new zero_run_kernel_t(options.min_run_length, options.max_output_size);
        const dictionary_t *dictionary = snapshot.get(stage);
        if (!dictionary) return NULL;
        return new token_kernel_t(stage, *dictionary, scan_of(stage), options.max_output_size);
    }

    static inline processing_result_t
    result(const state_t state, const uint_fast64_t szin, const bytes_t &out)
    {
        processing_result_t result;
        result.state = state;
        result.bytes_read = szin;
        result.bytes_written = out.size();
        return result;
    }

    static inline processing_result_t
    fail(const state_t state, const uint_fast64_t szin, bytes_t &out, statistics_t *statistics)
    {
        ZEROCOMPRESS_SHOW_STATE(fail, state);
        out.clear();
        if (statistics) statistics->record_error(state);
        return result(state, szin, out);
    }

    processing_result_t
    compress(const uint8_t *in, const uint_fast64_t szin, bytes_t &out,
             const dictionary_set_t &dictionaries, const options_t &options,
             statistics_t *statistics)
    {
        state_t state;
        stream_header_t header;
        bytes_t body, candidate;
        uint_fast64_t effective = szin, items;
        if ((state = options.check())) return fail(state, szin, out, statistics);
        const dictionary_set_t::snapshot_t snapshot = dictionaries.snapshot();
        layout_t layout(options.markers());
        header.setup();
        escape(in, szin, body, layout.markers);
        // A payload that could not be decoded again under the same options is refused
        if (body.size() > options.max_output_size)
            return fail(state_error_invalid_input, szin, out, statistics);
        for (size_t i = 0; i < stage_count; ++i) {
            const stage_t stage = (stage_t)i;
            if (statistics && stage < dictionary_stage_count)
                statistics->record_dictionary(stage, snapshot.get(stage));
            if (!options.enabled[stage]) continue;
            std::unique_ptr<kernel_t> kernel(create_kernel(stage, snapshot, options));
            if (!kernel) continue;
            candidate.clear();
            items = 0;
            if ((state = kernel->encode(layout, body.data(), body.size(), candidate, &items)))
                return fail(state, szin, out, statistics);
            // A stage is recorded only when it shrinks the payload
            if (!items || candidate.size() >= effective) continue;
            if (statistics) statistics->record_stage(stage, items, effective - candidate.size());
            effective = candidate.size();
            body.swap(candidate);
            header.append(layout.markers.stage_marker(stage));
            layout.activate(stage, kernel->layout_width());
        }
        out.clear();
        out.reserve(header.size() + effective);
        header.write(out);
        if (header.count) out.insert(out.end(), body.begin(), body.end());
        else out.insert(out.end(), in, in + szin);
        if (statistics) statistics->record_compress(szin, out.size());
        return result(state_ok, szin, out);
    }

    processing_result_t
    decompress(const uint8_t *in, const uint_fast64_t szin, bytes_t &out,
               const dictionary_set_t &dictionaries, const options_t &options,
               statistics_t *statistics)
    {
        state_t state;
        location_t location;
        stream_header_t header;
        bool applied[stage_count];
        bytes_t body, decoded;
        std::unique_ptr<kernel_t> kernels[stage_count];
        if ((state = options.check())) return fail(state, szin, out, statistics);
        const dictionary_set_t::snapshot_t snapshot = dictionaries.snapshot();
        layout_t layout(options.markers());
        location.encapsulate(in, szin);
        if ((state = header.read(&location, layout.markers, applied))) {
            if (state != state_error_version_mismatch) return fail(state, szin, out, statistics);
            // Unknown formats are handed back untouched
            out.assign(in, in + szin);
            if (statistics) statistics->record_error(state);
            return result(state, szin, out);
        }
        if (!header.count) {
            out.assign(location.pointer, location.pointer + location.available_bytes);
            if (statistics) statistics->record_decompress(szin, out.size());
            return result(state_ok, szin, out);
        }
        for (size_t i = 0; i < stage_count; ++i) {
            if (!applied[i]) continue;
            kernels[i].reset(create_kernel((stage_t)i, snapshot, options));
            if (!kernels[i]) return fail(state_error_dictionary_miss, szin, out, statistics);
            layout.activate((stage_t)i, kernels[i]->layout_width());
        }
        body.assign(location.pointer, location.pointer + location.available_bytes);
        for (size_t i = stage_count; i-- > 0;) {
            if (!kernels[i]) continue;
            decoded.clear();
            if ((state = kernels[i]->decode(layout, body.data(), body.size(), decoded)))
                return fail(state, szin, out, statistics);
            body.swap(decoded);
            layout.deactivate((stage_t)i);
        }
        if ((state = unescape(layout, body.data(), body.size(), out)))
            return fail(state, szin, out, statistics);
        if (statistics) statistics->record_decompress(szin, out.size());
        return result(state_ok, szin, out);
    }

    state_t
    compress_hex(const std::string &in, std::string &out, const dictionary_set_t &dictionaries,
                 const options_t &options, statistics_t *statistics)
    {
        state_t state;
        bytes_t raw, compressed;
        out.clear();
        if ((state = hex_decode(in, raw))) {
            if (statistics) statistics->record_error(state);
            return state;
        }
        if ((state = compress(raw.data(), raw.size(), compressed, dictionaries, options,
                              statistics).state))
            return state;
        out = hex_encode(compressed.data(), compressed.size());
        return state_ok;
    }

    state_t
    decompress_hex(const std::string &in, std::string &out, const dictionary_set_t &dictionaries,
                   const options_t &options, statistics_t *statistics)
    {
        state_t state;
        bytes_t compressed, raw;
        out.clear();
        if ((state = hex_decode(in, compressed))) {
            if (statistics) statistics->record_error(state);
            return state;
        }
        state = decompress(compressed.data(), compressed.size(), raw, dictionaries, options,
                           statistics).state;
        if (state && state != state_error_version_mismatch) return state;
        out = hex_encode(raw.data(), raw.size());
        return state;
    }

    void
    save_config(const dictionary_set_t &dictionaries, const options_t &options, bytes_t &out)
    {
        bytes_t record;
        uint8_t enabled = 0;
        for (size_t i = 0; i < stage_count; ++i)
            if (options.enabled[i]) enabled |= (uint8_t)(1 << i);
        record.push_back((uint8_t)options.marker_base);
        write_big_endian(record, options.min_run_length, 4);
        write_big_endian(record, options.max_output_size, 4);
        record.push_back(enabled);
        dictionaries.save(record);
        write_big_endian(out, config_magic, 4);
        write_big_endian(out, (uint_fast32_t)record.size(), 4);
        out.insert(out.end(), record.begin(), record.end());
    }

    state_t
    load_config(location_t *RESTRICT in, dictionary_set_t &dictionaries, options_t &options)
    {
        state_t state;
        uint_fast32_t magic, length, value;
        uint8_t byte;
        options_t loaded;
        dictionary_set_t::snapshot_t snapshot;
        if (!in->read_big_endian(&magic, 4) || magic != config_magic)
            return state_error_invalid_input;
        if (!in->read_big_endian(&length, 4) || length > in->available_bytes)
            return state_error_invalid_input;
        location_t record;
        record.encapsulate(in->pointer, length);
        if (!record.read_byte(&byte)) return state_error_invalid_input;
        loaded.marker_base = byte;
        if (!record.read_big_endian(&value, 4)) return state_error_invalid_input;
        loaded.min_run_length = value;
        if (!record.read_big_endian(&value, 4)) return state_error_invalid_input;
        loaded.max_output_size = value;
        if (!record.read_byte(&byte) || byte >> stage_count) return state_error_invalid_input;
        for (size_t i = 0; i < stage_count; ++i) loaded.enabled[i] = (byte >> i) & 1;
        if ((state = loaded.check())) return state;
        if ((state = dictionary_set_t::load(&record, snapshot))) return state;
        if (record.available_bytes) return state_error_invalid_input;
        in->consume(length);
        dictionaries.publish(snapshot);
        options = loaded;
        return state_ok;
    }

    bool
    write_config(FILE *RESTRICT wfp, const dictionary_set_t &dictionaries,
                 const options_t &options)
    {
        bytes_t record;
        save_config(dictionaries, options, record);
        return fwrite(record.data(), 1, record.size(), wfp) == record.size();
    }

    state_t
    read_config(FILE *RESTRICT rfp, dictionary_set_t &dictionaries, options_t &options)
    {
        bytes_t record(config_prefix_size);
        uint_fast32_t length, chunk;
        size_t offset;
        if (fread(record.data(), 1, record.size(), rfp) != record.size())
            return state_error_invalid_input;
        if (peek_big_endian(record.data(), 4) != config_magic) return state_error_invalid_input;
        length = peek_big_endian(record.data() + 4, 4);
        // Grow with the data actually read, the length field is untrusted
        while (length) {
            chunk = length < config_read_chunk ? length: (uint_fast32_t)config_read_chunk;
            offset = record.size();
            record.resize(offset + chunk);
            if (fread(record.data() + offset, 1, chunk, rfp) != chunk)
                return state_error_invalid_input;
            length -= chunk;
        }
        location_t in;
        in.encapsulate(record.data(), record.size());
        return load_config(&in, dictionaries, options);
    }
}
