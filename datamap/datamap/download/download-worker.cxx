#include <datamap/download/download-worker.hxx>

#include <iomanip>
#include <sstream>
#include <fstream>
#include <algorithm>

#include <openssl/evp.h>

using namespace std;

namespace datamap
{
  optional<uint64_t> download_worker_traits::
  available_space (const fs::path& dir)
  {
    error_code ec;
    fs::space_info si (fs::space (dir, ec));

    if (ec)
      return nullopt;

    return static_cast<uint64_t> (si.available);
  }

  string download_worker_traits::
  compute_hash (const fs::path& file, checksum_algorithm a)
  {
    ifstream ifs (file, ios::binary);
    if (!ifs)
      return string ();

    const EVP_MD* md (nullptr);

    switch (a)
    {
      case checksum_algorithm::md5:    md = EVP_md5 ();    break;
      case checksum_algorithm::sha1:   md = EVP_sha1 ();   break;
      case checksum_algorithm::sha256: md = EVP_sha256 (); break;
      case checksum_algorithm::sha512: md = EVP_sha512 (); break;
    }

    if (md == nullptr)
      return string ();

    EVP_MD_CTX* ctx (EVP_MD_CTX_new ());
    if (ctx == nullptr)
      return string ();

    if (EVP_DigestInit_ex (ctx, md, nullptr) != 1)
    {
      EVP_MD_CTX_free (ctx);
      return string ();
    }

    char buf[65536];
    while (ifs.read (buf, sizeof (buf)) || ifs.gcount () > 0)
    {
      if (EVP_DigestUpdate (ctx,
                            buf,
                            static_cast<size_t> (ifs.gcount ())) != 1)
      {
        EVP_MD_CTX_free (ctx);
        return string ();
      }
    }

    if (ifs.bad ())
    {
      EVP_MD_CTX_free (ctx);
      return string ();
    }

    unsigned char h[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    if (EVP_DigestFinal_ex (ctx, h, &n) != 1)
    {
      EVP_MD_CTX_free (ctx);
      return string ();
    }

    EVP_MD_CTX_free (ctx);

    ostringstream os;
    for (unsigned int i (0); i != n; ++i)
      os << hex << setw (2) << setfill ('0') << static_cast<int> (h[i]);

    return os.str ();
  }

  bool
  path_contained (const fs::path& root, const fs::path& path)
  {
    fs::path r (root.lexically_normal ());
    fs::path p (path.lexically_normal ());

    // Ignore the empty element a trailing separator leaves behind.
    //
    if (!r.empty () && r.filename ().empty ())
      r = r.parent_path ();

    if (r.empty ())
      return false;

    auto ri (r.begin ()), re (r.end ());
    auto pi (p.begin ()), pe (p.end ());

    for (; ri != re; ++ri, ++pi)
    {
      if (pi == pe || *ri != *pi)
        return false;
    }

    // The root itself is not a valid file destination.
    //
    return pi != pe;
  }
}
